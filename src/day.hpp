#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "lunch.hpp"
#include "message.hpp"
#include "time.hpp"

// Raw field contents as the user typed them
struct DayInput {
    Weekday day;
    std::string start;
    std::string end;
    std::string lunch;
};

struct DayResult {
    Weekday day;
    std::optional<TimeOfDay> normalizedStart;
    std::optional<TimeOfDay> normalizedEnd;
    uint32_t lunchMinutesUsed = 0;
    double hoursWorked = 0.0; // multiple of 0.25
    bool isAssumedFullDay = false;
    // Start is known but no end was entered yet. Contributes no hours.
    bool isOpen = false;
    std::vector<Message> messages;

    bool hasErrors() const;
    bool has(Message::Code code) const;
};

// Nearest multiple of 15, ties round up
uint32_t roundToQuarterHour(uint32_t minutes);

class DayProcessor {
public:
    struct Options {
        // Used (with a warning) if the start field is blank
        std::optional<TimeOfDay> defaultStart = std::nullopt;
        bool allowOpenEnd = false;
    };

    DayProcessor(const Config::Rules& rules);

    DayResult process(const DayInput& input) const;
    DayResult process(const DayInput& input, const Options& options) const;

private:
    Config::Rules rules_;
    LunchValidator lunchValidator_;
};
