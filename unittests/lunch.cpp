#include "test.hpp"

#include "lunch.hpp"

TEST_CASE("LunchValidator blank assumes default with a warning on every day")
{
    const LunchValidator validator(Config::Rules {});
    for (const auto day : weekdays) {
        const auto outcome = validator.validate("", day);
        TEST_REQUIRE(outcome.hasValue());
        TEST_CHECK(outcome->minutes == 60);
        TEST_REQUIRE(outcome->warning.has_value());
        TEST_CHECK(outcome->warning->severity == Message::Severity::Warning);
        TEST_CHECK(outcome->warning->code == Message::Code::LunchAssumed);
        TEST_CHECK(outcome->warning->field.has_value());
        TEST_CHECK(outcome->warning->field->day == day);
        TEST_CHECK(outcome->warning->field->field == Field::Lunch);
    }
}

TEST_CASE("LunchValidator whitespace only is blank")
{
    const LunchValidator validator(Config::Rules {});
    const auto outcome = validator.validate("  \t", Weekday::Tuesday);
    TEST_REQUIRE(outcome.hasValue());
    TEST_CHECK(outcome->minutes == 60);
    TEST_CHECK(outcome->warning.has_value());
}

TEST_CASE("LunchValidator uses configured default")
{
    Config::Rules rules;
    rules.defaultLunchMinutes = 30;
    const LunchValidator validator(rules);
    const auto outcome = validator.validate("", Weekday::Monday);
    TEST_REQUIRE(outcome.hasValue());
    TEST_CHECK(outcome->minutes == 30);
    TEST_CHECK(outcome->warning->text == "Monday: lunch assumed to be 30 minutes");
}

TEST_CASE("LunchValidator numbers")
{
    const LunchValidator validator(Config::Rules {});

    const auto zero = validator.validate("0", Weekday::Monday);
    TEST_REQUIRE(zero.hasValue());
    TEST_CHECK(zero->minutes == 0);
    TEST_CHECK(!zero->warning);

    const auto thirty = validator.validate(" 30 ", Weekday::Friday);
    TEST_REQUIRE(thirty.hasValue());
    TEST_CHECK(thirty->minutes == 30);
    TEST_CHECK(!thirty->warning);
}

TEST_CASE("LunchValidator rejects negative and non-numeric input")
{
    const LunchValidator validator(Config::Rules {});

    const auto negative = validator.validate("-15", Weekday::Monday);
    TEST_REQUIRE(!negative.hasValue());
    TEST_CHECK(negative.error().kind == ValidationError::Kind::Negative);

    const auto text = validator.validate("lots", Weekday::Monday);
    TEST_REQUIRE(!text.hasValue());
    TEST_CHECK(text.error().kind == ValidationError::Kind::NotANumber);

    const auto fraction = validator.validate("30.5", Weekday::Monday);
    TEST_CHECK(!fraction.hasValue());

    const auto plus = validator.validate("+30", Weekday::Monday);
    TEST_CHECK(!plus.hasValue());

    const auto huge = validator.validate("99999999999999999999999", Weekday::Monday);
    TEST_CHECK(!huge.hasValue());
}
