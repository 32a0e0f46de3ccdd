#include "test.hpp"

#include "week.hpp"

namespace {
std::array<DayInput, 5> fullWeek(std::string start, std::string end, std::string lunch)
{
    std::array<DayInput, 5> days;
    for (size_t i = 0; i < weekdays.size(); ++i) {
        days[i] = DayInput { weekdays[i], start, end, lunch };
    }
    return days;
}

size_t count(const WeekResult& result, Message::Code code)
{
    size_t n = 0;
    for (const auto& msg : result.overallMessages) {
        if (msg.code == code) {
            n++;
        }
    }
    return n;
}
}

TEST_CASE("WeekCalculator projects Friday clock-out")
{
    auto days = fullWeek("8:00 AM", "5:00 PM", "60");
    days[4] = DayInput { Weekday::Friday, "8:00 AM", "", "" };
    const auto result = WeekCalculator().calculate(days);

    TEST_REQUIRE(result.days.size() == 5);
    for (size_t i = 0; i < 4; ++i) {
        TEST_CHECK(result.days[i].hoursWorked == 8.0);
    }
    TEST_CHECK(result.days[4].isOpen);
    TEST_CHECK(result.days[4].hoursWorked == 0.0);
    TEST_CHECK(result.totalHoursWorked == 32.0);
    TEST_CHECK(result.hoursToTarget == 8.0);
    TEST_CHECK(result.fridayClockOut == (TimeOfDay { 17, 0 }));
    TEST_CHECK(!result.hasErrors());
    TEST_CHECK(count(result, Message::Code::LunchAssumed) == 1);
    TEST_CHECK(count(result, Message::Code::StartAssumed) == 0);
}

TEST_CASE("WeekCalculator target reached before Friday")
{
    auto days = fullWeek("8:00 AM", "7:00 PM", "60");
    days[4] = DayInput { Weekday::Friday, "8:00 AM", "", "30" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(result.totalHoursWorked == 40.0);
    TEST_CHECK(result.hoursToTarget <= 0.0);
    TEST_CHECK(result.fridayClockOut == (TimeOfDay { 8, 0 }));
    TEST_CHECK(count(result, Message::Code::TargetReachedBeforeFriday) == 1);
    TEST_REQUIRE(!result.overallMessages.empty());
    TEST_CHECK(result.overallMessages.back().severity == Message::Severity::Info);
    TEST_CHECK(result.overallMessages.back().text == "40 hours reached before Friday this week");
}

TEST_CASE("WeekCalculator blank Friday start assumes 8:00 AM")
{
    auto days = fullWeek("8:00 AM", "5:00 PM", "60");
    days[4] = DayInput { Weekday::Friday, "", "", "" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(!result.days[4].isAssumedFullDay);
    TEST_CHECK(result.days[4].normalizedStart == (TimeOfDay { 8, 0 }));
    TEST_CHECK(count(result, Message::Code::StartAssumed) == 1);
    TEST_CHECK(count(result, Message::Code::LunchAssumed) == 1);
    TEST_CHECK(result.fridayClockOut == (TimeOfDay { 17, 0 }));
    TEST_CHECK(result.totalHoursWorked == 32.0);
}

TEST_CASE("WeekCalculator empty week")
{
    const auto result = WeekCalculator().calculate(fullWeek("", "", ""));

    for (size_t i = 0; i < 4; ++i) {
        TEST_CHECK(result.days[i].isAssumedFullDay);
    }
    TEST_CHECK(result.totalHoursWorked == 32.0);
    TEST_CHECK(result.hoursToTarget == 8.0);
    TEST_CHECK(result.fridayClockOut == (TimeOfDay { 17, 0 }));
    TEST_CHECK(!result.hasErrors());
}

TEST_CASE("WeekCalculator invalid Monday start does not affect other days")
{
    auto days = fullWeek("8:00 AM", "5:00 PM", "60");
    days[0].start = "asdf";
    days[4] = DayInput { Weekday::Friday, "8:00 AM", "", "60" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(result.days[0].hoursWorked == 0.0);
    TEST_CHECK(result.days[1].hoursWorked == 8.0);
    TEST_CHECK(result.days[2].hoursWorked == 8.0);
    TEST_CHECK(result.days[3].hoursWorked == 8.0);
    TEST_CHECK(result.totalHoursWorked == 24.0);
    TEST_CHECK(result.hoursToTarget == 16.0);
    TEST_CHECK(count(result, Message::Code::InvalidTime) == 1);
    TEST_REQUIRE(!result.overallMessages.empty());
    const auto& first = result.overallMessages.front();
    TEST_CHECK(first.severity == Message::Severity::Error);
    TEST_CHECK(first.field.has_value());
    TEST_CHECK(first.field->day == Weekday::Monday);
    TEST_CHECK(first.field->field == Field::Start);
    TEST_CHECK(first.text.find("invalid time") != std::string::npos);
    // 16 more hours do not fit into Friday
    TEST_CHECK(!result.fridayClockOut);
    TEST_CHECK(count(result, Message::Code::TargetUnreachable) == 1);
}

TEST_CASE("WeekCalculator reports every invalid day separately")
{
    auto days = fullWeek("8:00 AM", "5:00 PM", "60");
    days[0].start = "nope";
    days[1].start = "25:00";
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(count(result, Message::Code::InvalidTime) == 2);
    TEST_REQUIRE(result.overallMessages.size() >= 2);
    TEST_CHECK(result.overallMessages[0].field->day == Weekday::Monday);
    TEST_CHECK(result.overallMessages[1].field->day == Weekday::Tuesday);
    TEST_CHECK(result.overallMessages[0].text != result.overallMessages[1].text);
}

TEST_CASE("WeekCalculator invalid Friday start makes the projection unavailable")
{
    auto days = fullWeek("8:00 AM", "5:00 PM", "60");
    days[4] = DayInput { Weekday::Friday, "later", "", "60" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(!result.fridayClockOut);
    TEST_CHECK(count(result, Message::Code::InvalidTime) == 1);
    TEST_CHECK(count(result, Message::Code::ProjectionUnavailable) == 1);
    TEST_CHECK(count(result, Message::Code::StartAssumed) == 0);
    TEST_CHECK(result.totalHoursWorked == 32.0);
}

TEST_CASE("WeekCalculator invalid Friday lunch makes the projection unavailable")
{
    auto days = fullWeek("8:00 AM", "5:00 PM", "60");
    days[4] = DayInput { Weekday::Friday, "8:00 AM", "", "-10" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(!result.fridayClockOut);
    TEST_CHECK(count(result, Message::Code::InvalidLunch) == 1);
    TEST_CHECK(count(result, Message::Code::ProjectionUnavailable) == 1);
    TEST_CHECK(count(result, Message::Code::LunchAssumed) == 0);
}

TEST_CASE("WeekCalculator entered Friday end wins over the projection")
{
    auto days = fullWeek("8:00 AM", "5:00 PM", "60");
    days[4] = DayInput { Weekday::Friday, "8:00 AM", "3:00 PM", "30" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(result.days[4].hoursWorked == 6.5);
    TEST_CHECK(result.totalHoursWorked == 38.5);
    TEST_CHECK(result.hoursToTarget == 1.5);
    TEST_CHECK(result.fridayClockOut == (TimeOfDay { 15, 0 }));
}

TEST_CASE("WeekCalculator over target")
{
    auto days = fullWeek("8:00 AM", "7:00 PM", "60");
    days[4] = DayInput { Weekday::Friday, "8:00 AM", "5:00 PM", "60" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(result.totalHoursWorked == 48.0);
    TEST_CHECK(result.hoursToTarget == -8.0);
    TEST_CHECK(result.fridayClockOut == (TimeOfDay { 17, 0 }));
    TEST_CHECK(count(result, Message::Code::TargetReachedBeforeFriday) == 1);
}

TEST_CASE("WeekCalculator total is the sum of rounded days")
{
    // 7:53 each, rounds to 8h per day while the unrounded sum would round to 31.5h
    auto days = fullWeek("8:00 AM", "4:53 PM", "60");
    days[4] = DayInput { Weekday::Friday, "8:00 AM", "", "60" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(result.totalHoursWorked == 32.0);
    TEST_CHECK(result.fridayClockOut == (TimeOfDay { 17, 0 }));
}

TEST_CASE("WeekCalculator target that cannot be reached on Friday")
{
    auto days = fullWeek("8:00 AM", "9:00 AM", "0");
    days[4] = DayInput { Weekday::Friday, "8:00 AM", "", "60" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(result.totalHoursWorked == 4.0);
    TEST_CHECK(!result.fridayClockOut);
    TEST_CHECK(count(result, Message::Code::TargetUnreachable) == 1);
    TEST_CHECK(!result.hasErrors());
}

TEST_CASE("WeekCalculator huge Friday lunch cannot wrap into a clock-out")
{
    auto days = fullWeek("8:00 AM", "5:00 PM", "60");
    days[4] = DayInput { Weekday::Friday, "8:00 AM", "", "4294966936" };
    const auto result = WeekCalculator().calculate(days);

    TEST_CHECK(result.days[4].isOpen);
    TEST_CHECK(result.days[4].lunchMinutesUsed == 4294966936u);
    TEST_CHECK(!result.fridayClockOut);
    TEST_CHECK(count(result, Message::Code::TargetUnreachable) == 1);
}

TEST_CASE("WeekCalculator uses configured rules")
{
    Config::Rules rules;
    rules.targetHours = 32;
    rules.fridayDefaultStart = TimeOfDay { 9, 0 };
    rules.defaultLunchMinutes = 30;
    const auto result = WeekCalculator(rules).calculate(fullWeek("", "", ""));

    TEST_CHECK(result.hoursToTarget == 0.0);
    TEST_CHECK(result.fridayClockOut == (TimeOfDay { 9, 0 }));
    TEST_CHECK(count(result, Message::Code::TargetReachedBeforeFriday) == 1);
    TEST_CHECK(result.days[4].lunchMinutesUsed == 30);
}

TEST_CASE("WeekCalculator orders messages by severity, then day, then week")
{
    auto days = fullWeek("8:00 AM", "5:00 PM", "");
    days[3].end = "7:00 AM";
    days[1].lunch = "x";
    days[4] = DayInput { Weekday::Friday, "bad", "", "" };
    const auto result = WeekCalculator().calculate(days);

    const auto& messages = result.overallMessages;
    TEST_REQUIRE(messages.size() == 8);
    // Errors: Tuesday lunch, Thursday end, Friday start, week projection
    TEST_CHECK(messages[0].code == Message::Code::InvalidLunch);
    TEST_CHECK(messages[1].code == Message::Code::EndBeforeStart);
    TEST_CHECK(messages[2].code == Message::Code::InvalidTime);
    TEST_CHECK(messages[3].code == Message::Code::ProjectionUnavailable);
    TEST_CHECK(!messages[3].field);
    // Warnings: lunch assumed on Monday, Wednesday, Thursday, Friday
    TEST_CHECK(messages[4].field->day == Weekday::Monday);
    TEST_CHECK(messages[5].field->day == Weekday::Wednesday);
    TEST_CHECK(messages[6].field->day == Weekday::Thursday);
    TEST_CHECK(messages[7].field->day == Weekday::Friday);
    for (size_t i = 4; i < messages.size(); ++i) {
        TEST_CHECK(messages[i].code == Message::Code::LunchAssumed);
    }
}
