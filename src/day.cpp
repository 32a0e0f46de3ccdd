#include "day.hpp"

#include "log.hpp"
#include "string.hpp"

namespace {
std::string dayPrefix(Weekday day)
{
    return std::string(toString(day)) + ": ";
}

// Parses a non-blank time field, reporting failure as an error on that field
std::optional<TimeOfDay> parseField(
    std::string_view raw, Weekday day, Field field, std::vector<Message>& messages)
{
    const auto role = field == Field::Start ? TimeRole::Start : TimeRole::End;
    const auto parsed = TimeOfDay::parse(raw, role);
    if (!parsed) {
        messages.push_back(Message::error(Message::Code::InvalidTime,
            dayPrefix(day) + "invalid time for " + std::string(toString(role)) + ": "
                + parsed.error().message,
            FieldRef { day, field }));
        return std::nullopt;
    }
    return *parsed;
}
}

bool DayResult::hasErrors() const
{
    for (const auto& msg : messages) {
        if (msg.severity == Message::Severity::Error) {
            return true;
        }
    }
    return false;
}

bool DayResult::has(Message::Code code) const
{
    for (const auto& msg : messages) {
        if (msg.code == code) {
            return true;
        }
    }
    return false;
}

uint32_t roundToQuarterHour(uint32_t minutes)
{
    return (2 * minutes + 15) / 30 * 15;
}

DayProcessor::DayProcessor(const Config::Rules& rules)
    : rules_(rules)
    , lunchValidator_(rules)
{
}

DayResult DayProcessor::process(const DayInput& input) const
{
    return process(input, Options {});
}

DayResult DayProcessor::process(const DayInput& input, const Options& options) const
{
    const auto day = input.day;
    const auto startRaw = trim(input.start);
    const auto endRaw = trim(input.end);
    const auto lunchRaw = trim(input.lunch);

    DayResult result { day };
    auto& messages = result.messages;

    std::optional<TimeOfDay> start;
    if (!startRaw.empty()) {
        start = parseField(startRaw, day, Field::Start, messages);
    } else if (options.defaultStart) {
        start = options.defaultStart;
        messages.push_back(Message::warning(Message::Code::StartAssumed,
            dayPrefix(day) + "start time assumed to be " + toString(*start),
            FieldRef { day, Field::Start }));
    }

    std::optional<TimeOfDay> end;
    if (!endRaw.empty()) {
        end = parseField(endRaw, day, Field::End, messages);
    }

    result.normalizedStart = start;
    result.normalizedEnd = end;

    const auto startBlank = startRaw.empty() && !options.defaultStart;
    const auto endBlank = endRaw.empty();

    if (startBlank && endBlank) {
        // Nothing entered is not a mistake, just an incomplete week
        result.isAssumedFullDay = true;
        result.hoursWorked = static_cast<double>(rules_.assumedDayHours);
        if (!lunchRaw.empty()) {
            const auto lunch = lunchValidator_.validate(lunchRaw, day);
            if (!lunch) {
                messages.push_back(Message::error(Message::Code::InvalidLunch,
                    dayPrefix(day) + "invalid lunch duration: " + lunch.error().message,
                    FieldRef { day, Field::Lunch }));
            }
        }
        slog::debug(toString(day), ": assuming ", rules_.assumedDayHours, " hours");
        return result;
    }

    std::optional<uint32_t> lunchMinutes;
    const auto lunch = lunchValidator_.validate(lunchRaw, day);
    if (lunch) {
        lunchMinutes = lunch->minutes;
        result.lunchMinutesUsed = lunch->minutes;
        if (lunch->warning) {
            messages.push_back(*lunch->warning);
        }
    } else {
        messages.push_back(Message::error(Message::Code::InvalidLunch,
            dayPrefix(day) + "invalid lunch duration: " + lunch.error().message,
            FieldRef { day, Field::Lunch }));
    }

    if (start && endBlank && options.allowOpenEnd) {
        result.isOpen = true;
        return result;
    }

    if (start && endBlank) {
        messages.push_back(Message::error(Message::Code::MissingTime,
            dayPrefix(day) + "end time is missing", FieldRef { day, Field::End }));
    }
    if (end && startBlank) {
        messages.push_back(Message::error(Message::Code::MissingTime,
            dayPrefix(day) + "start time is missing", FieldRef { day, Field::Start }));
    }

    if (!start || !end) {
        return result;
    }

    // Overnight shifts are not supported, so end must be later on the same day
    if (end->toMinutes() <= start->toMinutes()) {
        messages.push_back(Message::error(Message::Code::EndBeforeStart,
            dayPrefix(day) + "end time is before start time", FieldRef { day, Field::End }));
        return result;
    }

    if (!lunchMinutes) {
        return result;
    }

    const auto shiftMinutes = end->toMinutes() - start->toMinutes();
    if (*lunchMinutes > shiftMinutes) {
        messages.push_back(Message::error(Message::Code::LunchExceedsShift,
            dayPrefix(day) + "lunch exceeds shift length", FieldRef { day, Field::Lunch }));
        return result;
    }

    const auto workedMinutes = roundToQuarterHour(shiftMinutes - *lunchMinutes);
    result.hoursWorked = workedMinutes / 60.0;
    slog::debug(toString(day), ": ", toString(*start), " - ", toString(*end), ", lunch ",
        *lunchMinutes, "m, worked ", workedMinutes, "m");
    return result;
}
