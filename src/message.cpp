#include "message.hpp"

#include <tuple>

bool operator==(const FieldRef& a, const FieldRef& b)
{
    return a.day == b.day && a.field == b.field;
}

bool operator<(const FieldRef& a, const FieldRef& b)
{
    return std::make_tuple(a.day, a.field) < std::make_tuple(b.day, b.field);
}

Message Message::error(Code code, std::string text, std::optional<FieldRef> field)
{
    return Message { Severity::Error, code, std::move(text), field };
}

Message Message::warning(Code code, std::string text, std::optional<FieldRef> field)
{
    return Message { Severity::Warning, code, std::move(text), field };
}

Message Message::info(Code code, std::string text, std::optional<FieldRef> field)
{
    return Message { Severity::Info, code, std::move(text), field };
}

std::string_view toString(Weekday day)
{
    switch (day) {
    case Weekday::Monday:
        return "Monday";
    case Weekday::Tuesday:
        return "Tuesday";
    case Weekday::Wednesday:
        return "Wednesday";
    case Weekday::Thursday:
        return "Thursday";
    case Weekday::Friday:
        return "Friday";
    default:
        return "invalid";
    }
}

std::string_view toString(Field field)
{
    switch (field) {
    case Field::Start:
        return "start";
    case Field::End:
        return "end";
    case Field::Lunch:
        return "lunch";
    default:
        return "invalid";
    }
}

std::string_view toString(Message::Severity severity)
{
    switch (severity) {
    case Message::Severity::Error:
        return "error";
    case Message::Severity::Warning:
        return "warning";
    case Message::Severity::Info:
        return "info";
    default:
        return "invalid";
    }
}

std::string fieldId(const FieldRef& ref)
{
    return std::string(toString(ref.day)) + "_" + std::string(toString(ref.field));
}
