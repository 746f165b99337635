#include <gtest/gtest.h>
#include "input/InputSettings.hpp"
#include "input/ButtonMapping.hpp"
#include "engine/Config.hpp"

using namespace tenfoot;

TEST(InputSettingsTest, DefaultsWhenSectionMissing) {
    Config cfg;
    InputSettings settings = InputSettings::fromConfig(cfg);

    EXPECT_FLOAT_EQ(settings.analogDeadzone, 0.15f);
    EXPECT_EQ(settings.dpadRepeatDelay, 400);
    EXPECT_EQ(settings.dpadRepeatRate, 100);
    EXPECT_TRUE(settings.controllerMappings.empty());
}

TEST(InputSettingsTest, ReadsStoredValues) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "input": {
            "analogDeadzone": 0.25,
            "dpadRepeatDelay": 300,
            "dpadRepeatRate": 60
        }
    })"));

    InputSettings settings = InputSettings::fromConfig(cfg);
    EXPECT_FLOAT_EQ(settings.analogDeadzone, 0.25f);
    EXPECT_EQ(settings.dpadRepeatDelay, 300);
    EXPECT_EQ(settings.dpadRepeatRate, 60);
}

TEST(InputSettingsTest, OutOfRangeValuesAreClamped) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "input": {
            "analogDeadzone": 0.9,
            "dpadRepeatDelay": 100000,
            "dpadRepeatRate": 0
        }
    })"));

    InputSettings settings = InputSettings::fromConfig(cfg);
    EXPECT_FLOAT_EQ(settings.analogDeadzone, 0.5f);
    EXPECT_EQ(settings.dpadRepeatDelay, InputSettings::MAX_REPEAT_MS);
    EXPECT_EQ(settings.dpadRepeatRate, InputSettings::MIN_REPEAT_MS);
}

TEST(InputSettingsTest, WrongTypesFallBackToDefaults) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "input": {
            "analogDeadzone": "high",
            "dpadRepeatDelay": 2.5,
            "controllerMappings": [1, 2]
        }
    })"));

    InputSettings settings = InputSettings::fromConfig(cfg);
    EXPECT_FLOAT_EQ(settings.analogDeadzone, 0.15f);
    EXPECT_EQ(settings.dpadRepeatDelay, 400);
    EXPECT_TRUE(settings.controllerMappings.empty());
}

TEST(InputSettingsTest, MappingEntriesStartFromFamilyDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "input": {
            "controllerMappings": {
                "Pro Controller": { "start": 8, "select": 9 }
            }
        }
    })"));

    InputSettings settings = InputSettings::fromConfig(cfg);
    ASSERT_EQ(settings.controllerMappings.count("Pro Controller"), 1u);

    const ButtonMapping& mapping = settings.controllerMappings.at("Pro Controller");
    EXPECT_EQ(mapping.indexOf(ButtonAction::Start), 8);
    EXPECT_EQ(mapping.indexOf(ButtonAction::Select), 9);
    // Untouched actions keep the Nintendo layout
    EXPECT_EQ(mapping.indexOf(ButtonAction::Confirm), 1);
    EXPECT_EQ(mapping.indexOf(ButtonAction::Back), 0);
}

TEST(InputSettingsTest, MalformedMappingFieldsAreSkipped) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "input": {
            "controllerMappings": {
                "Arcade Stick": { "confirm": 5, "jump": 2, "back": -1, "lb": "four" },
                "Broken Pad": 7
            }
        }
    })"));

    InputSettings settings = InputSettings::fromConfig(cfg);
    EXPECT_EQ(settings.controllerMappings.count("Broken Pad"), 0u);
    ASSERT_EQ(settings.controllerMappings.count("Arcade Stick"), 1u);

    const ButtonMapping& mapping = settings.controllerMappings.at("Arcade Stick");
    EXPECT_EQ(mapping.indexOf(ButtonAction::Confirm), 5);
    EXPECT_EQ(mapping.indexOf(ButtonAction::Back), 1);
    EXPECT_EQ(mapping.indexOf(ButtonAction::LeftBumper), 4);
}

TEST(InputSettingsTest, ButtonIndexOutsideIntRangeIsSkipped) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "input": {
            "controllerMappings": {
                "Arcade Stick": { "confirm": 4294967299, "rb": -4294967289, "back": 6 }
            }
        }
    })"));

    InputSettings settings = InputSettings::fromConfig(cfg);
    ASSERT_EQ(settings.controllerMappings.count("Arcade Stick"), 1u);

    const ButtonMapping& mapping = settings.controllerMappings.at("Arcade Stick");
    EXPECT_EQ(mapping.indexOf(ButtonAction::Confirm), 0);
    EXPECT_EQ(mapping.indexOf(ButtonAction::RightBumper), 5);
    EXPECT_EQ(mapping.indexOf(ButtonAction::Back), 6);
}

TEST(InputSettingsTest, WriteThenReadPreservesSettings) {
    InputSettings original;
    original.analogDeadzone = 0.2f;
    original.dpadRepeatDelay = 250;
    original.dpadRepeatRate = 75;
    ButtonMapping custom = getDefaultMapping(ControllerType::Generic);
    custom.buttons[static_cast<std::size_t>(ButtonAction::Confirm)] = 2;
    original.controllerMappings["Arcade Stick"] = custom;

    Config cfg;
    original.writeTo(cfg);
    EXPECT_EQ(cfg.getInt("input.controllerMappings.Arcade Stick.confirm", -1), 2);

    InputSettings loaded = InputSettings::fromConfig(cfg);
    EXPECT_FLOAT_EQ(loaded.analogDeadzone, 0.2f);
    EXPECT_EQ(loaded.dpadRepeatDelay, 250);
    EXPECT_EQ(loaded.dpadRepeatRate, 75);
    ASSERT_EQ(loaded.controllerMappings.count("Arcade Stick"), 1u);
    EXPECT_EQ(loaded.controllerMappings.at("Arcade Stick"), custom);
}

TEST(InputSettingsTest, WriteKeepsUnrelatedKeys) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"window": {"width": 1280}, "input": {"extra": true}})"));

    InputSettings{}.writeTo(cfg);
    EXPECT_EQ(cfg.getInt("window.width"), 1280);
    EXPECT_TRUE(cfg.getBool("input.extra"));
    EXPECT_EQ(cfg.getInt("input.dpadRepeatRate"), 100);
}
