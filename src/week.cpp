#include "week.hpp"

#include <cmath>

#include "aggregate.hpp"
#include "log.hpp"

namespace {
uint32_t hoursToMinutes(double hours)
{
    return static_cast<uint32_t>(std::lround(hours * 60.0));
}
}

bool WeekResult::hasErrors() const
{
    for (const auto& msg : overallMessages) {
        if (msg.severity == Message::Severity::Error) {
            return true;
        }
    }
    return false;
}

WeekCalculator::WeekCalculator(const Config::Rules& rules)
    : rules_(rules)
    , dayProcessor_(rules)
{
}

WeekResult WeekCalculator::calculate(const std::array<DayInput, 5>& days) const
{
    WeekResult result;
    result.days.reserve(days.size());

    double preFridayHours = 0.0;
    for (size_t i = 0; i < days.size(); ++i) {
        const auto day = weekdays[i];
        const auto input = DayInput { day, days[i].start, days[i].end, days[i].lunch };
        if (day == Weekday::Friday) {
            result.days.push_back(dayProcessor_.process(
                input, DayProcessor::Options { rules_.fridayDefaultStart, true }));
        } else {
            result.days.push_back(dayProcessor_.process(input));
            preFridayHours += result.days.back().hoursWorked;
        }
    }

    const auto& friday = result.days.back();
    result.totalHoursWorked = preFridayHours + friday.hoursWorked;
    result.hoursToTarget = static_cast<double>(rules_.targetHours) - result.totalHoursWorked;
    result.fridayClockOut = projectFridayClockOut(friday, preFridayHours, result.weekMessages);
    result.overallMessages = aggregateMessages(result.days, result.weekMessages);

    slog::debug("Week: ", preFridayHours, "h before Friday, ", result.totalHoursWorked,
        "h total, ", result.hoursToTarget, "h to target, ", result.overallMessages.size(),
        " messages");
    return result;
}

std::optional<TimeOfDay> WeekCalculator::projectFridayClockOut(
    const DayResult& friday, double preFridayHours, std::vector<Message>& messages) const
{
    // A blank start was already replaced by the default, so this means it failed to parse
    if (!friday.normalizedStart) {
        messages.push_back(Message::error(Message::Code::ProjectionUnavailable,
            "Friday clock-out cannot be computed: invalid Friday start time"));
        return std::nullopt;
    }
    const auto start = *friday.normalizedStart;
    std::optional<TimeOfDay> enteredEnd;
    if (!friday.has(Message::Code::EndBeforeStart)) {
        enteredEnd = friday.normalizedEnd;
    }

    if (preFridayHours >= static_cast<double>(rules_.targetHours)) {
        messages.push_back(Message::info(Message::Code::TargetReachedBeforeFriday,
            std::to_string(rules_.targetHours) + " hours reached before Friday this week"));
        return enteredEnd ? *enteredEnd : start;
    }

    // Entered data always wins over the estimate
    if (enteredEnd) {
        return enteredEnd;
    }

    if (friday.has(Message::Code::InvalidLunch)) {
        messages.push_back(Message::error(Message::Code::ProjectionUnavailable,
            "Friday clock-out cannot be computed: invalid Friday lunch duration"));
        return std::nullopt;
    }

    const auto requiredMinutes = rules_.targetHours * 60 - hoursToMinutes(preFridayHours);
    // Lunch may be anything up to UINT32_MAX, so this must not wrap
    const auto clockOutMinutes = static_cast<uint64_t>(start.toMinutes()) + requiredMinutes
        + friday.lunchMinutesUsed;
    const auto clockOut = TimeOfDay::fromMinutes(clockOutMinutes);
    if (!clockOut) {
        messages.push_back(Message::warning(Message::Code::TargetUnreachable,
            std::to_string(rules_.targetHours)
                + " hours cannot be reached before midnight on Friday"));
        return std::nullopt;
    }
    slog::debug("Friday: ", requiredMinutes, "m required after ", toString(start),
        ", projected clock-out ", toString(*clockOut));
    return clockOut;
}
