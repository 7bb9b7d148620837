#include "app/settings.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <limits>

TEST(Settings, EmptyInputKeepsDefaults) {
    Settings s = SettingsManager().parse("");
    EXPECT_EQ(s.fps, 30);
    EXPECT_EQ(s.sound, 0);
    EXPECT_EQ(s.seed, 0u);
    EXPECT_EQ(s.field.width, 80);
    EXPECT_EQ(s.field.height, 25);
}

TEST(Settings, ReadsAllKeys) {
    Settings s = SettingsManager().parse(
        "{\n  \"fps\": 60,\n  \"sound\": 1,\n  \"seed\": 1234,\n  \"width\": 100,\n"
        "  \"height\": 31,\n  \"paddle_h\": 9,\n  \"paddle_speed\": 3\n}\n");
    EXPECT_EQ(s.fps, 60);
    EXPECT_EQ(s.sound, 1);
    EXPECT_EQ(s.seed, 1234u);
    EXPECT_EQ(s.field.width, 100);
    EXPECT_EQ(s.field.height, 31);
    EXPECT_EQ(s.field.paddle_h, 9);
    EXPECT_EQ(s.field.paddle_speed, 3);
}

TEST(Settings, ClampsRateAndSound) {
    SettingsManager m;
    EXPECT_EQ(m.parse("{\"fps\": 500}").fps, 120);
    EXPECT_EQ(m.parse("{\"fps\": 5}").fps, 15);
    EXPECT_EQ(m.parse("{\"fps\": 45}").fps, 30);
    EXPECT_EQ(m.parse("{\"sound\": 7}").sound, 1);
    EXPECT_EQ(m.parse("{\"seed\": -3}").seed, 0u);
}

TEST(Settings, MalformedValuesKeepDefaults) {
    Settings s = SettingsManager().parse("{\"fps\": \"fast\", \"width\": }");
    EXPECT_EQ(s.fps, 30);
    EXPECT_EQ(s.field.width, 80);
}

TEST(Settings, GeometryIsLeftForValidation) {
    Settings s = SettingsManager().parse("{\"paddle_h\": 40}");
    EXPECT_EQ(s.field.paddle_h, 40);
    EXPECT_THROW(validate_field_config(s.field), ConfigError);
}

TEST(Settings, LoadReportsMissingFile) {
    bool found = true;
    Settings s = SettingsManager().load("/nonexistent/autopong_settings.json", &found);
    EXPECT_FALSE(found);
    EXPECT_EQ(s.fps, 30);
}

TEST(Settings, LoadReadsFile) {
    std::string path = ::testing::TempDir() + "autopong_settings_test.json";
    {
        std::ofstream ofs(path, std::ios::trunc);
        ofs << "{ \"fps\": 120, \"sound\": 1 }\n";
    }
    bool found = false;
    Settings s = SettingsManager().load(path, &found);
    EXPECT_TRUE(found);
    EXPECT_EQ(s.fps, 120);
    EXPECT_EQ(s.sound, 1);
    std::remove(path.c_str());
}

TEST(Settings, OutOfRangeIntegersKeepDefaults) {
    SettingsManager m;
    Settings s = m.parse("{\"width\": 4294967376, \"paddle_h\": 4294967303, \"height\": -2147483649}");
    EXPECT_EQ(s.field.width, 80);
    EXPECT_EQ(s.field.paddle_h, 7);
    EXPECT_EQ(s.field.height, 25);
    EXPECT_EQ(m.parse("{\"paddle_speed\": 2147483647}").field.paddle_speed, 2147483647);
    EXPECT_EQ(m.parse("{\"width\": -2147483648}").field.width, std::numeric_limits<int>::min());
}

TEST(Settings, OversizedGeometryIsRejectedByValidation) {
    Settings s = SettingsManager().parse("{\"paddle_speed\": 2147483647, \"width\": 1000000000}");
    EXPECT_THROW(validate_field_config(s.field), ConfigError);
}

TEST(Settings, SeedUsesFullSixtyFourBits) {
    SettingsManager m;
    EXPECT_EQ(m.parse("{\"seed\": 18446744073709551615}").seed, 18446744073709551615ULL);
    EXPECT_EQ(m.parse("{\"seed\": 1234567890123456789}").seed, 1234567890123456789ULL);
    EXPECT_EQ(m.parse("{\"seed\": 18446744073709551616}").seed, 0u);
}
