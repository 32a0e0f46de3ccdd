#include "time.hpp"

#include <cassert>

#include "string.hpp"

namespace {
enum class Meridiem { None, Am, Pm };

std::optional<Meridiem> parseMeridiem(std::string_view str)
{
    if (str.empty()) {
        return Meridiem::None;
    }
    if (ciEqual(str, "a") || ciEqual(str, "am")) {
        return Meridiem::Am;
    }
    if (ciEqual(str, "p") || ciEqual(str, "pm")) {
        return Meridiem::Pm;
    }
    return std::nullopt;
}

ErrorWrapper<ParseError> malformed(std::string_view str)
{
    return error(ParseError {
        ParseError::Kind::Malformed, "'" + std::string(str) + "' is not a valid time" });
}
}

std::optional<TimeOfDay> TimeOfDay::fromMinutes(uint64_t minutes)
{
    if (minutes >= 24 * 60) {
        return std::nullopt;
    }
    return TimeOfDay {
        static_cast<uint32_t>(minutes / 60), static_cast<uint32_t>(minutes % 60) };
}

Result<TimeOfDay, ParseError> TimeOfDay::parse(std::string_view str, TimeRole role)
{
    const auto s = trim(str);
    if (s.empty()) {
        return error(ParseError { ParseError::Kind::Empty, "time is empty" });
    }

    size_t pos = 0;
    while (pos < s.size() && pos < 2 && isDigit(s[pos])) {
        pos++;
    }
    if (pos == 0) {
        return malformed(s);
    }
    const auto hourStr = s.substr(0, pos);

    auto minuteStr = std::string_view();
    if (pos < s.size() && s[pos] == ':') {
        pos++;
        if (pos + 2 > s.size() || !isDigit(s[pos]) || !isDigit(s[pos + 1])) {
            return malformed(s);
        }
        minuteStr = s.substr(pos, 2);
        pos += 2;
    } else if (pos == 2 && pos + 2 <= s.size() && isDigit(s[pos]) && isDigit(s[pos + 1])) {
        // "0830"
        minuteStr = s.substr(pos, 2);
        pos += 2;
    }
    if (pos < s.size() && isDigit(s[pos])) {
        return malformed(s);
    }

    const auto meridiem = parseMeridiem(trim(s.substr(pos)));
    if (!meridiem) {
        return malformed(s);
    }

    auto hour = parseInt<uint32_t>(hourStr).value();
    const auto minute = minuteStr.empty() ? 0 : parseInt<uint32_t>(minuteStr).value();

    if (hour > 23) {
        return error(ParseError { ParseError::Kind::HourOutOfRange, "hour must be in [0, 23]" });
    }
    if (minute > 59) {
        return error(
            ParseError { ParseError::Kind::MinuteOutOfRange, "minute must be in [0, 59]" });
    }

    if (*meridiem != Meridiem::None) {
        if (hour == 0 || hour > 12) {
            return error(ParseError { ParseError::Kind::MeridiemWithInvalidHour,
                "hour must be in [1, 12] when AM or PM is given" });
        }
        hour %= 12;
        if (*meridiem == Meridiem::Pm) {
            hour += 12;
        }
    } else if (hour >= 1 && hour <= 12) {
        // 0 and 13-23 can only be 24-hour time, so those are never shifted
        if (role == TimeRole::Start) {
            hour %= 12;
        } else if (hour != 12) {
            hour += 12;
        }
    }

    assert(hour < 24 && minute < 60);
    return TimeOfDay { hour, minute };
}

bool operator==(const TimeOfDay& a, const TimeOfDay& b)
{
    return a.toMinutes() == b.toMinutes();
}

bool operator!=(const TimeOfDay& a, const TimeOfDay& b)
{
    return !(a == b);
}

bool operator<(const TimeOfDay& a, const TimeOfDay& b)
{
    return a.toMinutes() < b.toMinutes();
}

std::string toString(const TimeOfDay& t)
{
    const auto displayHour = t.hour() % 12 == 0 ? 12 : t.hour() % 12;
    return std::to_string(displayHour) + ":" + rjust(std::to_string(t.minute()), 2, '0')
        + (t.hour() < 12 ? " AM" : " PM");
}

std::string_view toString(TimeRole role)
{
    switch (role) {
    case TimeRole::Start:
        return "start";
    case TimeRole::End:
        return "end";
    default:
        return "invalid";
    }
}
