#include "test.hpp"

#include "time.hpp"

namespace {
bool parsesTo(std::string_view str, TimeRole role, uint32_t hour, uint32_t minute)
{
    const auto t = TimeOfDay::parse(str, role);
    return t && t->hour() == hour && t->minute() == minute;
}

bool failsWith(std::string_view str, TimeRole role, ParseError::Kind kind)
{
    const auto t = TimeOfDay::parse(str, role);
    return !t && t.error().kind == kind;
}
}

TEST_CASE("TimeOfDay::parse bare hour")
{
    TEST_CHECK(parsesTo("8", TimeRole::Start, 8, 0));
    TEST_CHECK(parsesTo("5", TimeRole::End, 17, 0));
    TEST_CHECK(parsesTo("  9  ", TimeRole::Start, 9, 0));
}

TEST_CASE("TimeOfDay::parse meridiem variants")
{
    TEST_CHECK(parsesTo("8a", TimeRole::End, 8, 0));
    TEST_CHECK(parsesTo("8 AM", TimeRole::End, 8, 0));
    TEST_CHECK(parsesTo("8 PM", TimeRole::Start, 20, 0));
    TEST_CHECK(parsesTo("8p", TimeRole::Start, 20, 0));
    TEST_CHECK(parsesTo("5:30pm", TimeRole::Start, 17, 30));
    TEST_CHECK(parsesTo("5:30 Pm", TimeRole::Start, 17, 30));
    TEST_CHECK(parsesTo("12 AM", TimeRole::Start, 0, 0));
    TEST_CHECK(parsesTo("12:15 PM", TimeRole::Start, 12, 15));
}

TEST_CASE("TimeOfDay::parse H:MM and HHMM")
{
    TEST_CHECK(parsesTo("8:00", TimeRole::Start, 8, 0));
    TEST_CHECK(parsesTo("08:45", TimeRole::Start, 8, 45));
    TEST_CHECK(parsesTo("0830", TimeRole::Start, 8, 30));
    TEST_CHECK(parsesTo("4:30", TimeRole::End, 16, 30));
}

TEST_CASE("TimeOfDay::parse role defaults for twelve")
{
    TEST_CHECK(parsesTo("12", TimeRole::Start, 0, 0));
    TEST_CHECK(parsesTo("12", TimeRole::End, 12, 0));
    TEST_CHECK(parsesTo("12:30", TimeRole::End, 12, 30));
}

TEST_CASE("TimeOfDay::parse 24-hour numerals are never shifted")
{
    TEST_CHECK(parsesTo("16:00", TimeRole::End, 16, 0));
    TEST_CHECK(parsesTo("16:00", TimeRole::Start, 16, 0));
    TEST_CHECK(parsesTo("13", TimeRole::Start, 13, 0));
    TEST_CHECK(parsesTo("0:30", TimeRole::End, 0, 30));
    TEST_CHECK(parsesTo("00:00", TimeRole::End, 0, 0));
    TEST_CHECK(parsesTo("23:59", TimeRole::Start, 23, 59));
    TEST_CHECK(toString(TimeOfDay::parse("16:00", TimeRole::End).value()) == "4:00 PM");
}

TEST_CASE("TimeOfDay::parse fails")
{
    TEST_CHECK(failsWith("", TimeRole::Start, ParseError::Kind::Empty));
    TEST_CHECK(failsWith("   ", TimeRole::Start, ParseError::Kind::Empty));
    TEST_CHECK(failsWith("asdf", TimeRole::Start, ParseError::Kind::Malformed));
    TEST_CHECK(failsWith("8:0", TimeRole::Start, ParseError::Kind::Malformed));
    TEST_CHECK(failsWith("8:", TimeRole::Start, ParseError::Kind::Malformed));
    TEST_CHECK(failsWith("830", TimeRole::Start, ParseError::Kind::Malformed));
    TEST_CHECK(failsWith("8:300", TimeRole::Start, ParseError::Kind::Malformed));
    TEST_CHECK(failsWith("8 30", TimeRole::Start, ParseError::Kind::Malformed));
    TEST_CHECK(failsWith("8 xm", TimeRole::Start, ParseError::Kind::Malformed));
    TEST_CHECK(failsWith("-8", TimeRole::Start, ParseError::Kind::Malformed));
    TEST_CHECK(failsWith("24:00", TimeRole::End, ParseError::Kind::HourOutOfRange));
    TEST_CHECK(failsWith("99", TimeRole::End, ParseError::Kind::HourOutOfRange));
    TEST_CHECK(failsWith("8:60", TimeRole::End, ParseError::Kind::MinuteOutOfRange));
    TEST_CHECK(failsWith("13 PM", TimeRole::End, ParseError::Kind::MeridiemWithInvalidHour));
    TEST_CHECK(failsWith("0 AM", TimeRole::End, ParseError::Kind::MeridiemWithInvalidHour));
}

TEST_CASE("TimeOfDay toString")
{
    TEST_CHECK(toString(TimeOfDay { 0, 0 }) == "12:00 AM");
    TEST_CHECK(toString(TimeOfDay { 0, 5 }) == "12:05 AM");
    TEST_CHECK(toString(TimeOfDay { 11, 59 }) == "11:59 AM");
    TEST_CHECK(toString(TimeOfDay { 12, 0 }) == "12:00 PM");
    TEST_CHECK(toString(TimeOfDay { 23, 59 }) == "11:59 PM");
}

TEST_CASE("TimeOfDay canonical string parses back to the same time")
{
    for (uint32_t minutes = 0; minutes < 24 * 60; minutes += 7) {
        const auto t = TimeOfDay::fromMinutes(minutes).value();
        const auto str = toString(t);
        TEST_CHECK(TimeOfDay::parse(str, TimeRole::Start).value() == t);
        TEST_CHECK(TimeOfDay::parse(str, TimeRole::End).value() == t);
    }
}

TEST_CASE("TimeOfDay::fromMinutes")
{
    TEST_CHECK(TimeOfDay::fromMinutes(0).value() == (TimeOfDay { 0, 0 }));
    TEST_CHECK(TimeOfDay::fromMinutes(17 * 60 + 5).value() == (TimeOfDay { 17, 5 }));
    TEST_CHECK(!TimeOfDay::fromMinutes(24 * 60));
    TEST_CHECK(!TimeOfDay::fromMinutes(uint64_t(1) << 32));
}

TEST_CASE("TimeOfDay accessors")
{
    const auto t = TimeOfDay::parse("4:05 PM", TimeRole::Start).value();
    TEST_CHECK(t.hour() == 16);
    TEST_CHECK(t.minute() == 5);
    TEST_CHECK(t.toMinutes() == 16 * 60 + 5);
}
