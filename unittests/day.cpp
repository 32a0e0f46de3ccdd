#include "test.hpp"

#include "day.hpp"
#include "string.hpp"

namespace {
DayResult process(std::string start, std::string end, std::string lunch,
    Weekday day = Weekday::Monday, DayProcessor::Options options = {})
{
    const DayProcessor processor(Config::Rules {});
    return processor.process(
        DayInput { day, std::move(start), std::move(end), std::move(lunch) }, options);
}

size_t count(const DayResult& result, Message::Severity severity)
{
    size_t n = 0;
    for (const auto& msg : result.messages) {
        if (msg.severity == severity) {
            n++;
        }
    }
    return n;
}

bool hasFieldMessage(const DayResult& result, Message::Code code, Field field)
{
    for (const auto& msg : result.messages) {
        if (msg.code == code && msg.field && msg.field->field == field) {
            return true;
        }
    }
    return false;
}
}

TEST_CASE("roundToQuarterHour")
{
    TEST_CHECK(roundToQuarterHour(0) == 0);
    TEST_CHECK(roundToQuarterHour(7) == 0);
    TEST_CHECK(roundToQuarterHour(8) == 15);
    TEST_CHECK(roundToQuarterHour(22) == 15);
    TEST_CHECK(roundToQuarterHour(23) == 30);
    TEST_CHECK(roundToQuarterHour(480) == 480);
    TEST_CHECK(roundToQuarterHour(487) == 480);
    TEST_CHECK(roundToQuarterHour(488) == 495);
}

TEST_CASE("DayProcessor complete day")
{
    const auto result = process("8:00 AM", "5:00 PM", "60");
    TEST_CHECK(result.hoursWorked == 8.0);
    TEST_CHECK(!result.isAssumedFullDay);
    TEST_CHECK(!result.isOpen);
    TEST_CHECK(result.lunchMinutesUsed == 60);
    TEST_CHECK(result.messages.empty());
    TEST_CHECK(result.normalizedStart == (TimeOfDay { 8, 0 }));
    TEST_CHECK(result.normalizedEnd == (TimeOfDay { 17, 0 }));
}

TEST_CASE("DayProcessor rounds worked time to quarter hours")
{
    TEST_CHECK(process("8:00", "4:38", "30").hoursWorked == 8.25);
    TEST_CHECK(process("8:00", "4:37", "30").hoursWorked == 8.0);
    TEST_CHECK(process("8:03", "12:00", "0").hoursWorked == 4.0);
    TEST_CHECK(process("8:00", "12:53", "0").hoursWorked == 5.0);
}

TEST_CASE("DayProcessor worked hours are multiples of a quarter")
{
    for (uint32_t endMinute = 0; endMinute < 60; ++endMinute) {
        const auto end = "5:" + rjust(std::to_string(endMinute), 2, '0') + " PM";
        const auto hours = process("8:00 AM", end, "45").hoursWorked;
        TEST_CHECK(hours >= 0.0);
        TEST_CHECK(hours * 4.0 == static_cast<double>(static_cast<int>(hours * 4.0)));
    }
}

TEST_CASE("DayProcessor blank lunch assumes an hour with one warning")
{
    const auto result = process("8", "5", "");
    TEST_CHECK(result.hoursWorked == 8.0);
    TEST_CHECK(result.lunchMinutesUsed == 60);
    TEST_CHECK(count(result, Message::Severity::Warning) == 1);
    TEST_CHECK(hasFieldMessage(result, Message::Code::LunchAssumed, Field::Lunch));
    TEST_CHECK(count(result, Message::Severity::Error) == 0);
}

TEST_CASE("DayProcessor zero lunch")
{
    const auto result = process("8", "4", "0");
    TEST_CHECK(result.hoursWorked == 8.0);
    TEST_CHECK(result.messages.empty());
}

TEST_CASE("DayProcessor blank day assumes a full day")
{
    const auto result = process("", "", "");
    TEST_CHECK(result.isAssumedFullDay);
    TEST_CHECK(result.hoursWorked == 8.0);
    TEST_CHECK(result.lunchMinutesUsed == 0);
    TEST_CHECK(result.messages.empty());
    TEST_CHECK(!result.normalizedStart);
    TEST_CHECK(!result.normalizedEnd);
}

TEST_CASE("DayProcessor blank day still reports an invalid lunch")
{
    const auto result = process("", "  ", "abc");
    TEST_CHECK(result.isAssumedFullDay);
    TEST_CHECK(result.hoursWorked == 8.0);
    TEST_CHECK(count(result, Message::Severity::Error) == 1);
    TEST_CHECK(hasFieldMessage(result, Message::Code::InvalidLunch, Field::Lunch));
}

TEST_CASE("DayProcessor invalid start")
{
    const auto result = process("asdf", "5:00 PM", "60");
    TEST_CHECK(result.hoursWorked == 0.0);
    TEST_CHECK(!result.isAssumedFullDay);
    TEST_CHECK(count(result, Message::Severity::Error) == 1);
    TEST_CHECK(hasFieldMessage(result, Message::Code::InvalidTime, Field::Start));
    TEST_CHECK(!result.normalizedStart);
    TEST_CHECK(result.normalizedEnd == (TimeOfDay { 17, 0 }));
    TEST_REQUIRE(!result.messages.empty());
    TEST_CHECK(result.messages[0].text.find("Monday: invalid time for start") == 0);
}

TEST_CASE("DayProcessor invalid start and end report one error each")
{
    const auto result = process("x", "y", "60");
    TEST_CHECK(result.hoursWorked == 0.0);
    TEST_CHECK(count(result, Message::Severity::Error) == 2);
    TEST_CHECK(hasFieldMessage(result, Message::Code::InvalidTime, Field::Start));
    TEST_CHECK(hasFieldMessage(result, Message::Code::InvalidTime, Field::End));
}

TEST_CASE("DayProcessor failing fields do not stop lunch validation")
{
    const auto result = process("x", "5", "-5");
    TEST_CHECK(count(result, Message::Severity::Error) == 2);
    TEST_CHECK(hasFieldMessage(result, Message::Code::InvalidTime, Field::Start));
    TEST_CHECK(hasFieldMessage(result, Message::Code::InvalidLunch, Field::Lunch));
}

TEST_CASE("DayProcessor half-entered day is an error, not an assumption")
{
    const auto startOnly = process("8:00", "", "60");
    TEST_CHECK(startOnly.hoursWorked == 0.0);
    TEST_CHECK(!startOnly.isAssumedFullDay);
    TEST_CHECK(hasFieldMessage(startOnly, Message::Code::MissingTime, Field::End));
    TEST_CHECK(startOnly.normalizedStart == (TimeOfDay { 8, 0 }));

    const auto endOnly = process("", "5:00", "60");
    TEST_CHECK(endOnly.hoursWorked == 0.0);
    TEST_CHECK(!endOnly.isAssumedFullDay);
    TEST_CHECK(hasFieldMessage(endOnly, Message::Code::MissingTime, Field::Start));
}

TEST_CASE("DayProcessor invalid start with blank end only reports the invalid field")
{
    const auto result = process("8:75", "", "60");
    TEST_CHECK(count(result, Message::Severity::Error) == 1);
    TEST_CHECK(hasFieldMessage(result, Message::Code::InvalidTime, Field::Start));
}

TEST_CASE("DayProcessor end before start")
{
    const auto result = process("17:00", "8:00 AM", "60");
    TEST_CHECK(result.hoursWorked == 0.0);
    TEST_CHECK(hasFieldMessage(result, Message::Code::EndBeforeStart, Field::End));

    const auto equal = process("9:00", "9:00 AM", "0");
    TEST_CHECK(equal.hoursWorked == 0.0);
    TEST_CHECK(hasFieldMessage(equal, Message::Code::EndBeforeStart, Field::End));
}

TEST_CASE("DayProcessor invalid lunch on a complete day is not substituted")
{
    const auto result = process("8", "5", "lunch");
    TEST_CHECK(result.hoursWorked == 0.0);
    TEST_CHECK(count(result, Message::Severity::Error) == 1);
    TEST_CHECK(count(result, Message::Severity::Warning) == 0);
    TEST_CHECK(hasFieldMessage(result, Message::Code::InvalidLunch, Field::Lunch));
}

TEST_CASE("DayProcessor lunch longer than the shift")
{
    const auto result = process("8", "9 AM", "90");
    TEST_CHECK(result.hoursWorked == 0.0);
    TEST_CHECK(hasFieldMessage(result, Message::Code::LunchExceedsShift, Field::Lunch));
}

TEST_CASE("DayProcessor default start and open end")
{
    const auto options = DayProcessor::Options { TimeOfDay { 8, 0 }, true };

    const auto open = process("", "", "", Weekday::Friday, options);
    TEST_CHECK(open.isOpen);
    TEST_CHECK(!open.isAssumedFullDay);
    TEST_CHECK(open.hoursWorked == 0.0);
    TEST_CHECK(open.normalizedStart == (TimeOfDay { 8, 0 }));
    TEST_CHECK(open.lunchMinutesUsed == 60);
    TEST_CHECK(count(open, Message::Severity::Error) == 0);
    TEST_CHECK(hasFieldMessage(open, Message::Code::StartAssumed, Field::Start));
    TEST_CHECK(hasFieldMessage(open, Message::Code::LunchAssumed, Field::Lunch));

    const auto complete = process("", "4:30", "30", Weekday::Friday, options);
    TEST_CHECK(!complete.isOpen);
    TEST_CHECK(complete.hoursWorked == 8.0);
    TEST_CHECK(hasFieldMessage(complete, Message::Code::StartAssumed, Field::Start));

    const auto entered = process("7:00", "", "30", Weekday::Friday, options);
    TEST_CHECK(entered.isOpen);
    TEST_CHECK(entered.normalizedStart == (TimeOfDay { 7, 0 }));
    TEST_CHECK(entered.messages.empty());
}
