#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

enum class Weekday { Monday = 0, Tuesday, Wednesday, Thursday, Friday };

constexpr std::array<Weekday, 5> weekdays { Weekday::Monday, Weekday::Tuesday,
    Weekday::Wednesday, Weekday::Thursday, Weekday::Friday };

enum class Field { Start, End, Lunch };

struct FieldRef {
    Weekday day;
    Field field;
};

bool operator==(const FieldRef& a, const FieldRef& b);
bool operator<(const FieldRef& a, const FieldRef& b);

struct Message {
    enum class Severity { Error, Warning, Info };

    enum class Code {
        // Errors
        InvalidTime,
        MissingTime,
        EndBeforeStart,
        InvalidLunch,
        LunchExceedsShift,
        ProjectionUnavailable,
        // Warnings
        LunchAssumed,
        StartAssumed,
        TargetUnreachable,
        // Info
        TargetReachedBeforeFriday,
    };

    Severity severity;
    Code code;
    std::string text;
    std::optional<FieldRef> field = std::nullopt; // nullopt for week-level messages

    static Message error(Code code, std::string text, std::optional<FieldRef> field = std::nullopt);
    static Message warning(
        Code code, std::string text, std::optional<FieldRef> field = std::nullopt);
    static Message info(Code code, std::string text, std::optional<FieldRef> field = std::nullopt);
};

std::string_view toString(Weekday day);
std::string_view toString(Field field);
std::string_view toString(Message::Severity severity);

// "Monday_start", like the identifiers used for input fields
std::string fieldId(const FieldRef& ref);
