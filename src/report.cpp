#include "report.hpp"

#include <array>
#include <cmath>
#include <cstdlib>
#include <optional>

#include "string.hpp"

namespace {
constexpr const char* ESC_RESET = "\x1b[0m";
constexpr const char* ESC_BOLD = "\x1b[1m";

std::string_view escapeCode(Color color)
{
    switch (color) {
    case Color::Red:
        return "\x1b[31m";
    case Color::Yellow:
        return "\x1b[33m";
    case Color::Green:
        return "\x1b[32m";
    default:
        return "";
    }
}

std::string colorize(std::string_view str, Color color, bool enabled)
{
    if (!enabled || color == Color::Neutral) {
        return std::string(str);
    }
    return std::string(escapeCode(color)) + std::string(str) + ESC_RESET;
}

std::string_view sectionTitle(Message::Severity severity)
{
    switch (severity) {
    case Message::Severity::Error:
        return "Errors";
    case Message::Severity::Warning:
        return "Warnings";
    case Message::Severity::Info:
        return "Info";
    default:
        return "Other";
    }
}
}

Color colorOf(Message::Severity severity)
{
    switch (severity) {
    case Message::Severity::Error:
        return Color::Red;
    case Message::Severity::Warning:
        return Color::Yellow;
    case Message::Severity::Info:
        return Color::Green;
    default:
        return Color::Neutral;
    }
}

std::string formatHours(double hours)
{
    static constexpr std::array<const char*, 4> fractions { "", ".25", ".5", ".75" };
    const auto quarters = std::lround(hours * 4.0);
    const auto absQuarters = std::labs(quarters);
    return (quarters < 0 ? "-" : "") + std::to_string(absQuarters / 4)
        + fractions[static_cast<size_t>(absQuarters % 4)];
}

Report buildReport(const WeekResult& result)
{
    Report report;
    for (const auto& day : result.days) {
        Report::Day row { day.day };
        if (day.normalizedStart) {
            row.startText = toString(*day.normalizedStart);
        }
        if (day.normalizedEnd) {
            row.endText = toString(*day.normalizedEnd);
        }
        if (!day.isAssumedFullDay && !day.has(Message::Code::InvalidLunch)) {
            row.lunchText = std::to_string(day.lunchMinutesUsed);
        }
        row.hoursText = formatHours(day.hoursWorked);
        row.isAssumedFullDay = day.isAssumedFullDay;
        row.isOpen = day.isOpen;
        report.days.push_back(std::move(row));

        for (const auto& msg : day.messages) {
            if (msg.code == Message::Code::LunchAssumed) {
                report.lunchWarningDays.insert(day.day);
            }
        }
    }

    report.totalHoursText = formatHours(result.totalHoursWorked);
    report.hoursToTargetText = formatHours(result.hoursToTarget);
    report.hoursToTargetIsOvertime = result.hoursToTarget < 0.0;
    report.fridayClockOutText = result.fridayClockOut ? toString(*result.fridayClockOut) : "";

    for (const auto& msg : result.overallMessages) {
        if (msg.severity == Message::Severity::Error && msg.field) {
            // Keep the first error for each field
            report.fieldErrors.emplace(*msg.field, msg.text);
        }
    }
    report.messages = result.overallMessages;
    return report;
}

std::string renderReport(const Report& report, bool color)
{
    std::string out;
    const auto bold = [color](std::string_view str) {
        return color ? ESC_BOLD + std::string(str) + ESC_RESET : std::string(str);
    };

    out += bold(ljust("Day", 11) + ljust("Start", 10) + ljust("End", 10) + ljust("Lunch", 7)
               + "Hours")
        + "\n";
    for (const auto& day : report.days) {
        auto lunch = day.lunchText;
        if (report.lunchWarningDays.count(day.day)) {
            lunch = colorize(ljust(lunch + "*", 7), Color::Yellow, color);
        } else {
            lunch = ljust(lunch, 7);
        }

        auto hours = day.hoursText;
        if (day.isAssumedFullDay) {
            hours += " (assumed)";
        } else if (day.isOpen) {
            hours += " (open)";
        }

        const auto startError = report.fieldErrors.count(FieldRef { day.day, Field::Start }) > 0;
        const auto endError = report.fieldErrors.count(FieldRef { day.day, Field::End }) > 0;
        out += ljust(toString(day.day), 11)
            + colorize(ljust(startError && day.startText.empty() ? "?" : day.startText, 10),
                startError ? Color::Red : Color::Neutral, color)
            + colorize(ljust(endError && day.endText.empty() ? "?" : day.endText, 10),
                endError ? Color::Red : Color::Neutral, color)
            + lunch + hours + "\n";
    }
    out += "\n";
    out += "Total hours:      " + report.totalHoursText + "\n";
    out += "Hours to target:  "
        + colorize(report.hoursToTargetText,
            report.hoursToTargetIsOvertime ? Color::Green : Color::Neutral, color)
        + "\n";
    out += "Friday clock-out: "
        + (report.fridayClockOutText.empty() ? std::string("-") : report.fridayClockOutText)
        + "\n";

    // Messages are already ordered by severity
    std::optional<Message::Severity> section;
    for (const auto& msg : report.messages) {
        if (!section || *section != msg.severity) {
            section = msg.severity;
            out += "\n" + bold(sectionTitle(msg.severity)) + ":\n";
        }
        out += "  " + colorize(msg.text, colorOf(msg.severity), color) + "\n";
    }
    return out;
}
