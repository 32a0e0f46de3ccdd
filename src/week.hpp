#pragma once

#include <array>
#include <optional>
#include <vector>

#include "config.hpp"
#include "day.hpp"
#include "message.hpp"
#include "time.hpp"

struct WeekResult {
    std::vector<DayResult> days; // Monday to Friday
    double totalHoursWorked = 0.0;
    // Negative if the target was exceeded
    double hoursToTarget = 0.0;
    // Advisory. If Friday's end is entered, it is that end time.
    std::optional<TimeOfDay> fridayClockOut;
    // Messages that do not belong to a single day
    std::vector<Message> weekMessages;
    // All messages of all days and the week, see aggregateMessages
    std::vector<Message> overallMessages;

    bool hasErrors() const;
};

class WeekCalculator {
public:
    WeekCalculator(const Config::Rules& rules = Config::Rules {});

    // days[i] is expected to be weekdays[i]. The day field of the inputs is not consulted.
    WeekResult calculate(const std::array<DayInput, 5>& days) const;

private:
    std::optional<TimeOfDay> projectFridayClockOut(
        const DayResult& friday, double preFridayHours, std::vector<Message>& messages) const;

    Config::Rules rules_;
    DayProcessor dayProcessor_;
};
