#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"

// Which half of a shift a time belongs to. Decides the meridiem of ambiguous input like "5".
enum class TimeRole { Start, End };

struct ParseError {
    enum class Kind {
        Empty,
        Malformed,
        HourOutOfRange,
        MinuteOutOfRange,
        MeridiemWithInvalidHour,
    };

    Kind kind;
    std::string message;
};

// A time of day without a date, minute resolution. There are no setters, a TimeOfDay only
// changes by assigning a new value.
class TimeOfDay {
public:
    // hour must be in [0, 23] and minute in [0, 59]. Use parse or fromMinutes for untrusted input.
    constexpr TimeOfDay(uint32_t hour, uint32_t minute)
        : hour_(hour)
        , minute_(minute)
    {
    }

    constexpr uint32_t hour() const { return hour_; }
    constexpr uint32_t minute() const { return minute_; }
    constexpr uint32_t toMinutes() const { return hour_ * 60 + minute_; }

    // nullopt if minutes is not before midnight
    static std::optional<TimeOfDay> fromMinutes(uint64_t minutes);

    // Accepts "8", "8a", "8 PM", "8:30", "8:30pm", "0830", "16:00" (case-insensitive meridiem).
    // Without a meridiem an hour in [1, 12] is AM for TimeRole::Start and PM for TimeRole::End.
    // Hours 0 and 13-23 are always read as 24-hour time.
    static Result<TimeOfDay, ParseError> parse(std::string_view str, TimeRole role);

private:
    uint32_t hour_;
    uint32_t minute_;
};

bool operator==(const TimeOfDay& a, const TimeOfDay& b);
bool operator!=(const TimeOfDay& a, const TimeOfDay& b);
bool operator<(const TimeOfDay& a, const TimeOfDay& b);

// Canonical "H:MM AM/PM", e.g. "8:00 AM", "12:30 PM"
std::string toString(const TimeOfDay& t);

std::string_view toString(TimeRole role);
