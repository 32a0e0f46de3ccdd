#include "config.hpp"

#include <limits>

#include <joml.hpp>

#include "log.hpp"
#include "message.hpp"
#include "string.hpp"
#include "util.hpp"

namespace {
std::optional<std::string> substituteEnvVars(std::string_view source)
{
    std::string ret;
    size_t cursor = 0;
    while (cursor < source.size()) {
        const auto start = source.find("${", cursor);
        ret.append(source.substr(cursor, start - cursor));
        if (start == std::string_view::npos) {
            break;
        }

        const auto end = source.find("}", start);
        if (end == std::string_view::npos) {
            slog::error("Unmatched environment variable expansion");
            return std::nullopt;
        }

        const auto arg = source.substr(start + 2, end - start - 2);
        const auto colon = arg.find(':');
        const auto var = std::string(colon == std::string_view::npos ? arg : arg.substr(0, colon));
        const auto defaultValue = colon == std::string_view::npos
            ? std::optional<std::string_view> { std::nullopt }
            : std::optional<std::string_view> { arg.substr(colon + 1) };

        const auto envValue = getEnv(var);
        if (envValue) {
            ret.append(*envValue);
        } else if (defaultValue) {
            ret.append(*defaultValue);
        } else {
            slog::error("Environment variable '", var, "' is not defined.");
            return std::nullopt;
        }

        cursor = end + 1;
    }
    return ret;
}

template <typename T>
bool loadInteger(const joml::Node& value, std::string_view name, T& dest)
{
    if (!value.is<int64_t>()) {
        slog::error("'", name, "' must be an integer");
        return false;
    }
    const auto i = value.as<int64_t>();

    constexpr int64_t min = std::numeric_limits<T>::min();
    constexpr int64_t max = std::numeric_limits<T>::max();
    if (i < min || i > max) {
        slog::error("'", name, "' must be in [", min, ", ", max, "]");
        return false;
    }

    dest = static_cast<T>(i);
    return true;
}

bool loadString(const joml::Node& value, std::string_view name, std::string& dest)
{
    if (!value.is<std::string>()) {
        slog::error("'", name, "' must be a string");
        return false;
    }
    dest = value.as<std::string>();
    return true;
}

bool loadTime(const joml::Node& value, std::string_view name, TimeOfDay& dest)
{
    std::string str;
    if (!loadString(value, name, str)) {
        return false;
    }
    const auto parsed = TimeOfDay::parse(str, TimeRole::Start);
    if (!parsed) {
        slog::error("'", name, "' must be a valid time of day: ", parsed.error().message);
        return false;
    }
    dest = *parsed;
    return true;
}

std::optional<Weekday> parseWeekday(std::string_view str)
{
    for (const auto day : weekdays) {
        if (ciEqual(str, toString(day))) {
            return day;
        }
    }
    return std::nullopt;
}

#define CHECK_OR_FALSE(cond)                                                                       \
    if (!(cond)) {                                                                                 \
        return false;                                                                              \
    }

bool loadRules(const joml::Node& node, Config::Rules& rules)
{
    if (!node.isDictionary()) {
        slog::error("'rules' must be a dictionary");
        return false;
    }

    for (const auto& [key, value] : node.asDictionary()) {
        if (key == "target_hours") {
            CHECK_OR_FALSE(loadInteger(value, "target_hours", rules.targetHours));
        } else if (key == "assumed_day_hours") {
            CHECK_OR_FALSE(loadInteger(value, "assumed_day_hours", rules.assumedDayHours));
        } else if (key == "default_lunch_minutes") {
            CHECK_OR_FALSE(
                loadInteger(value, "default_lunch_minutes", rules.defaultLunchMinutes));
        } else if (key == "friday_default_start") {
            CHECK_OR_FALSE(loadTime(value, "friday_default_start", rules.fridayDefaultStart));
        } else {
            slog::error("Invalid key '", key, "' in 'rules'");
            return false;
        }
    }
    return validate(rules);
}

bool loadDayEntry(const joml::Node& node, std::string_view dayName, Config::DayEntry& entry)
{
    if (!node.isDictionary()) {
        slog::error("'", dayName, "' must be a dictionary");
        return false;
    }

    for (const auto& [key, value] : node.asDictionary()) {
        const auto name = std::string(dayName) + "." + key;
        if (key == "start") {
            CHECK_OR_FALSE(loadString(value, name, entry.start));
        } else if (key == "end") {
            CHECK_OR_FALSE(loadString(value, name, entry.end));
        } else if (key == "lunch") {
            // Minutes may be written as a number, but validation happens on the raw text
            if (value.is<int64_t>()) {
                entry.lunch = std::to_string(value.as<int64_t>());
            } else {
                CHECK_OR_FALSE(loadString(value, name, entry.lunch));
            }
        } else {
            slog::error("Invalid key '", key, "' in '", dayName, "'");
            return false;
        }
    }
    return true;
}

bool loadWeek(const joml::Node& node, std::array<Config::DayEntry, 5>& week)
{
    if (!node.isDictionary()) {
        slog::error("'week' must be a dictionary");
        return false;
    }

    for (const auto& [key, value] : node.asDictionary()) {
        const auto day = parseWeekday(key);
        if (!day) {
            slog::error("Invalid key '", key, "' in 'week'. Must be one of Monday to Friday");
            return false;
        }
        CHECK_OR_FALSE(loadDayEntry(value, key, week[static_cast<size_t>(*day)]));
    }
    return true;
}
}

bool validate(const Config::Rules& rules)
{
    if (rules.targetHours < 1 || rules.targetHours > 7 * 24) {
        slog::error("'target_hours' must be in [1, 168]");
        return false;
    }
    if (rules.assumedDayHours > 24) {
        slog::error("'assumed_day_hours' must be in [0, 24]");
        return false;
    }
    if (rules.defaultLunchMinutes > 24 * 60) {
        slog::error("'default_lunch_minutes' must be in [0, 1440]");
        return false;
    }
    return true;
}

bool Config::loadFromFile(const std::string& path)
{
    const auto source = readFile(path);
    if (!source) {
        // already logged
        return false;
    }
    slog::debug("Loading config from '", path, "'");
    return loadFromSource(*source);
}

bool Config::loadFromSource(std::string_view source)
{
    const auto substSource = substituteEnvVars(source);
    if (!substSource) {
        return false;
    }

    const auto joml = joml::parse(*substSource);
    if (!joml) {
        const auto err = joml.error();
        slog::error("Could not parse JOML config: ", err.string(), "\n",
            joml::getContextString(*substSource, err.position));
        return false;
    }

    // Only commit if everything loaded
    auto copy = *this;

    for (const auto& [key, value] : *joml) {
        if (key == "rules") {
            CHECK_OR_FALSE(loadRules(value, copy.rules));
        } else if (key == "week") {
            CHECK_OR_FALSE(loadWeek(value, copy.week));
        } else {
            slog::error("Invalid key '", key, "'");
            return false;
        }
    }

    *this = std::move(copy);
    return true;
}

Config& Config::get()
{
    static Config config;
    return config;
}
