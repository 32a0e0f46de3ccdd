#include <cstdio>
#include <iostream>

#include <unistd.h>

#include <clipp.hpp>

#include "config.hpp"
#include "log.hpp"
#include "report.hpp"
#include "week.hpp"

struct Args : clipp::ArgsBase {
    std::vector<std::string> monday;
    std::vector<std::string> tuesday;
    std::vector<std::string> wednesday;
    std::vector<std::string> thursday;
    std::vector<std::string> friday;
    bool debug = false;
    bool checkConfig = false;
    bool noColor = false;
    std::optional<std::string> config;

    void args()
    {
        flag(monday, "monday").num(3).valueNames("START", "END", "LUNCH").help("Monday entries");
        flag(tuesday, "tuesday").num(3).valueNames("START", "END", "LUNCH").help("Tuesday entries");
        flag(wednesday, "wednesday")
            .num(3)
            .valueNames("START", "END", "LUNCH")
            .help("Wednesday entries");
        flag(thursday, "thursday")
            .num(3)
            .valueNames("START", "END", "LUNCH")
            .help("Thursday entries");
        flag(friday, "friday").num(3).valueNames("START", "END", "LUNCH").help("Friday entries");
        flag(debug, "debug").help("Enable debug logging");
        flag(checkConfig, "check-config").help("Check the configuration and exit");
        flag(noColor, "no-color").help("Do not use colors in the output");
        positional(config, "config").optional();
    }

    const std::vector<std::string>& entries(Weekday day) const
    {
        switch (day) {
        case Weekday::Monday:
            return monday;
        case Weekday::Tuesday:
            return tuesday;
        case Weekday::Wednesday:
            return wednesday;
        case Weekday::Thursday:
            return thursday;
        default:
            return friday;
        }
    }
};

int main(int argc, char** argv)
{
    auto parser = clipp::Parser(argv[0]);
    parser.version("1.0.0");
    const Args args = parser.parse<Args>(argc, argv).value();
    slog::init(args.debug ? slog::Severity::Debug : slog::Severity::Info, !args.noColor);

    auto& config = Config::get();
    if (args.config && !config.loadFromFile(*args.config)) {
        return 1;
    }

    if (args.checkConfig) {
        slog::info("Configuration is valid");
        return 0;
    }

    slog::debug("Target Hours: ", config.rules.targetHours);
    slog::debug("Assumed Day Hours: ", config.rules.assumedDayHours);
    slog::debug("Default Lunch Minutes: ", config.rules.defaultLunchMinutes);
    slog::debug("Friday Default Start: ", toString(config.rules.fridayDefaultStart));

    std::array<DayInput, 5> days;
    for (size_t i = 0; i < weekdays.size(); ++i) {
        const auto day = weekdays[i];
        const auto& fromArgs = args.entries(day);
        if (fromArgs.size() == 3) {
            days[i] = DayInput { day, fromArgs[0], fromArgs[1], fromArgs[2] };
        } else {
            const auto& entry = config.week[i];
            days[i] = DayInput { day, entry.start, entry.end, entry.lunch };
        }
    }

    const auto calculator = WeekCalculator(config.rules);
    const auto result = calculator.calculate(days);
    const auto report = buildReport(result);

    const auto color = !args.noColor && ::isatty(STDOUT_FILENO);
    std::cout << renderReport(report, color) << std::flush;

    return result.hasErrors() ? 2 : 0;
}
