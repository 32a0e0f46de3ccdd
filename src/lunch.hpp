#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "message.hpp"
#include "result.hpp"

struct ValidationError {
    enum class Kind { NotANumber, Negative };

    Kind kind;
    std::string message;
};

struct LunchOutcome {
    uint32_t minutes;
    // Set if the lunch duration was assumed rather than entered
    std::optional<Message> warning;
};

class LunchValidator {
public:
    LunchValidator(const Config::Rules& rules);

    // Blank input assumes the default lunch duration with a warning, "0" means no lunch.
    Result<LunchOutcome, ValidationError> validate(std::string_view raw, Weekday day) const;

private:
    uint32_t defaultMinutes_;
};
