#include "test.hpp"

#include "report.hpp"

namespace {
std::array<DayInput, 5> week(std::string start, std::string end, std::string lunch)
{
    std::array<DayInput, 5> days;
    for (size_t i = 0; i < weekdays.size(); ++i) {
        days[i] = DayInput { weekdays[i], start, end, lunch };
    }
    return days;
}

bool contains(const std::string& haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string::npos;
}
}

TEST_CASE("formatHours trims trailing zeros")
{
    TEST_CHECK(formatHours(8.0) == "8");
    TEST_CHECK(formatHours(7.5) == "7.5");
    TEST_CHECK(formatHours(8.25) == "8.25");
    TEST_CHECK(formatHours(0.75) == "0.75");
    TEST_CHECK(formatHours(0.0) == "0");
    TEST_CHECK(formatHours(-8.0) == "-8");
    TEST_CHECK(formatHours(-0.5) == "-0.5");
    TEST_CHECK(formatHours(40.0) == "40");
}

TEST_CASE("colorOf")
{
    TEST_CHECK(colorOf(Message::Severity::Error) == Color::Red);
    TEST_CHECK(colorOf(Message::Severity::Warning) == Color::Yellow);
    TEST_CHECK(colorOf(Message::Severity::Info) == Color::Green);
}

TEST_CASE("buildReport normalizes times for writing back")
{
    auto days = week("8", "5", "60");
    days[4] = DayInput { Weekday::Friday, "", "", "" };
    const auto report = buildReport(WeekCalculator().calculate(days));

    TEST_REQUIRE(report.days.size() == 5);
    TEST_CHECK(report.days[0].startText == "8:00 AM");
    TEST_CHECK(report.days[0].endText == "5:00 PM");
    TEST_CHECK(report.days[0].lunchText == "60");
    TEST_CHECK(report.days[0].hoursText == "8");
    TEST_CHECK(report.days[4].startText == "8:00 AM");
    TEST_CHECK(report.days[4].endText.empty());
    TEST_CHECK(report.days[4].isOpen);
    TEST_CHECK(report.totalHoursText == "32");
    TEST_CHECK(report.hoursToTargetText == "8");
    TEST_CHECK(!report.hoursToTargetIsOvertime);
    TEST_CHECK(report.fridayClockOutText == "5:00 PM");
    TEST_CHECK(report.lunchWarningDays.size() == 1);
    TEST_CHECK(report.lunchWarningDays.count(Weekday::Friday) == 1);
}

TEST_CASE("buildReport overtime")
{
    const auto report = buildReport(WeekCalculator().calculate(week("7:00", "5:30 PM", "30")));
    TEST_CHECK(report.totalHoursText == "50");
    TEST_CHECK(report.hoursToTargetText == "-10");
    TEST_CHECK(report.hoursToTargetIsOvertime);
}

TEST_CASE("buildReport field errors")
{
    auto days = week("8", "5", "60");
    days[0].start = "asdf";
    days[2].lunch = "-1";
    const auto report = buildReport(WeekCalculator().calculate(days));

    TEST_CHECK(report.fieldErrors.size() == 2);
    TEST_CHECK(report.fieldErrors.count(FieldRef { Weekday::Monday, Field::Start }) == 1);
    TEST_CHECK(report.fieldErrors.count(FieldRef { Weekday::Wednesday, Field::Lunch }) == 1);
    TEST_CHECK(report.days[0].startText.empty());
    TEST_CHECK(report.days[0].hoursText == "0");
    TEST_CHECK(report.days[2].lunchText.empty());
}

TEST_CASE("renderReport lists days and messages")
{
    auto days = week("8", "5", "60");
    days[0].start = "asdf";
    days[4] = DayInput { Weekday::Friday, "", "", "" };
    const auto text = renderReport(buildReport(WeekCalculator().calculate(days)), false);

    TEST_CHECK(contains(text, "Monday"));
    TEST_CHECK(contains(text, "Friday"));
    TEST_CHECK(contains(text, "Errors:"));
    TEST_CHECK(contains(text, "Warnings:"));
    TEST_CHECK(contains(text, "Monday: invalid time for start"));
    TEST_CHECK(contains(text, "Friday: start time assumed to be 8:00 AM"));
    TEST_CHECK(text.find("Errors:") < text.find("Warnings:"));
    TEST_CHECK(!contains(text, "\x1b["));
}

TEST_CASE("renderReport with colors")
{
    auto days = week("8", "5", "60");
    days[0].start = "asdf";
    const auto text = renderReport(buildReport(WeekCalculator().calculate(days)), true);
    TEST_CHECK(contains(text, "\x1b[31mMonday: invalid time for start"));
}
