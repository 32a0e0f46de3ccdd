#include "lunch.hpp"

#include <limits>

#include "string.hpp"

LunchValidator::LunchValidator(const Config::Rules& rules)
    : defaultMinutes_(rules.defaultLunchMinutes)
{
}

Result<LunchOutcome, ValidationError> LunchValidator::validate(
    std::string_view raw, Weekday day) const
{
    const auto str = trim(raw);
    if (str.empty()) {
        auto text = std::string(toString(day)) + ": lunch assumed to be "
            + std::to_string(defaultMinutes_) + " minutes";
        return LunchOutcome { defaultMinutes_,
            Message::warning(Message::Code::LunchAssumed, std::move(text),
                FieldRef { day, Field::Lunch }) };
    }

    // from_chars accepts a leading '-' for signed types, so we get to tell negatives apart
    const auto minutes = parseInt<int64_t>(str);
    if (!minutes) {
        return error(ValidationError { ValidationError::Kind::NotANumber,
            "'" + std::string(str) + "' is not a whole number of minutes" });
    }
    if (*minutes < 0) {
        return error(ValidationError {
            ValidationError::Kind::Negative, "lunch duration must not be negative" });
    }
    if (*minutes > std::numeric_limits<uint32_t>::max()) {
        return error(ValidationError { ValidationError::Kind::NotANumber,
            "'" + std::string(str) + "' is too large" });
    }
    return LunchOutcome { static_cast<uint32_t>(*minutes), std::nullopt };
}
