#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "message.hpp"
#include "week.hpp"

enum class Color { Neutral, Red, Yellow, Green };

// Error is red, Warning yellow, Info green
Color colorOf(Message::Severity severity);

// Everything a front end needs to display a WeekResult, already formatted.
struct Report {
    struct Day {
        Weekday day;
        // Canonical times to write back into the input fields. Empty if the field did not parse.
        std::string startText;
        std::string endText;
        std::string lunchText;
        std::string hoursText;
        bool isAssumedFullDay;
        bool isOpen;
    };

    std::vector<Day> days;
    std::string totalHoursText;
    std::string hoursToTargetText;
    // Only an exceeded target is highlighted (green)
    bool hoursToTargetIsOvertime;
    std::string fridayClockOutText;
    std::map<FieldRef, std::string> fieldErrors;
    std::set<Weekday> lunchWarningDays;
    std::vector<Message> messages;
};

// Trims trailing zeros: 8 -> "8", 7.5 -> "7.5", 8.25 -> "8.25"
std::string formatHours(double hours);

Report buildReport(const WeekResult& result);

// Plain text table followed by the messages grouped by severity
std::string renderReport(const Report& report, bool color);
