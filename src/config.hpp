#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "time.hpp"

struct Config {
    struct Rules {
        uint32_t targetHours = 40;
        // Worked hours credited for a day with neither start nor end
        uint32_t assumedDayHours = 8;
        uint32_t defaultLunchMinutes = 60;
        TimeOfDay fridayDefaultStart = { 8, 0 };
    };

    struct DayEntry {
        std::string start;
        std::string end;
        std::string lunch;
    };

    Rules rules;
    // Indexed by Weekday
    std::array<DayEntry, 5> week;

    bool loadFromFile(const std::string& path);
    bool loadFromSource(std::string_view source);

    static Config& get();
};

// Logs and returns false if a value is out of range
bool validate(const Config::Rules& rules);
