#include "test.hpp"

#include "config.hpp"

TEST_CASE("Config defaults")
{
    const Config config;
    TEST_CHECK(config.rules.targetHours == 40);
    TEST_CHECK(config.rules.assumedDayHours == 8);
    TEST_CHECK(config.rules.defaultLunchMinutes == 60);
    TEST_CHECK(config.rules.fridayDefaultStart == (TimeOfDay { 8, 0 }));
    TEST_CHECK(validate(config.rules));
}

TEST_CASE("Config loads rules and week")
{
    Config config;
    const auto ok = config.loadFromSource(R"(
rules: {
  target_hours: 38
  default_lunch_minutes: 30
  friday_default_start: "7:30"
}
week: {
  monday: { start: "8:00 AM", end: "5 PM", lunch: 45 }
  Tuesday: { lunch: "" }
}
)");
    TEST_REQUIRE(ok);
    TEST_CHECK(config.rules.targetHours == 38);
    TEST_CHECK(config.rules.assumedDayHours == 8);
    TEST_CHECK(config.rules.defaultLunchMinutes == 30);
    TEST_CHECK(config.rules.fridayDefaultStart == (TimeOfDay { 7, 30 }));
    TEST_CHECK(config.week[0].start == "8:00 AM");
    TEST_CHECK(config.week[0].end == "5 PM");
    TEST_CHECK(config.week[0].lunch == "45");
    TEST_CHECK(config.week[1].lunch.empty());
    TEST_CHECK(config.week[4].start.empty());
}

TEST_CASE("Config substitutes environment variable defaults")
{
    Config config;
    TEST_REQUIRE(config.loadFromSource(
        "rules: { target_hours: ${WEEKHOURS_UNITTEST_SURELY_UNSET:35} }"));
    TEST_CHECK(config.rules.targetHours == 35);
}

TEST_CASE("Config rejects invalid input and keeps the old values")
{
    Config config;
    TEST_CHECK(!config.loadFromSource("rules: { target_hours: 0 }"));
    TEST_CHECK(!config.loadFromSource("rules: { target_hours: 200 }"));
    TEST_CHECK(!config.loadFromSource("rules: { assumed_day_hours: 25 }"));
    TEST_CHECK(!config.loadFromSource("rules: { default_lunch_minutes: -1 }"));
    TEST_CHECK(!config.loadFromSource("rules: { friday_default_start: \"noon\" }"));
    TEST_CHECK(!config.loadFromSource("rules: { target: 40 }"));
    TEST_CHECK(!config.loadFromSource("week: { saturday: { start: \"8\" } }"));
    TEST_CHECK(!config.loadFromSource("week: { monday: { start: 8 } }"));
    TEST_CHECK(!config.loadFromSource("holidays: 3"));
    TEST_CHECK(!config.loadFromSource("rules: { target_hours: ${WEEKHOURS_UNITTEST_SURELY_UNSET} }"));
    TEST_CHECK(!config.loadFromSource("rules: {"));

    TEST_CHECK(!config.loadFromSource(
        "week: { monday: { start: \"9:00\" } }\nrules: { target_hours: 0 }"));
    TEST_CHECK(config.week[0].start.empty());
    TEST_CHECK(config.rules.targetHours == 40);
}
