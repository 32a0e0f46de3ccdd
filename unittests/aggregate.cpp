#include "test.hpp"

#include "aggregate.hpp"

namespace {
DayResult dayWith(Weekday day, std::vector<Message> messages)
{
    DayResult result { day };
    result.messages = std::move(messages);
    return result;
}
}

TEST_CASE("aggregateMessages keeps every message")
{
    const std::vector<DayResult> days {
        dayWith(Weekday::Monday,
            { Message::error(Message::Code::InvalidTime, "a", FieldRef { Weekday::Monday,
                  Field::Start }),
                Message::error(Message::Code::InvalidTime, "a",
                    FieldRef { Weekday::Monday, Field::Start }) }),
        dayWith(Weekday::Tuesday, {}),
    };
    const std::vector<Message> week { Message::error(Message::Code::ProjectionUnavailable, "a") };

    const auto messages = aggregateMessages(days, week);
    TEST_CHECK(messages.size() == 3);
}

TEST_CASE("aggregateMessages orders by severity, then day, then week")
{
    const std::vector<DayResult> days {
        dayWith(Weekday::Monday,
            { Message::info(Message::Code::TargetReachedBeforeFriday, "mon info"),
                Message::warning(Message::Code::LunchAssumed, "mon warning") }),
        dayWith(Weekday::Wednesday,
            { Message::warning(Message::Code::LunchAssumed, "wed warning 1"),
                Message::error(Message::Code::InvalidLunch, "wed error"),
                Message::warning(Message::Code::LunchAssumed, "wed warning 2") }),
        dayWith(Weekday::Friday, { Message::error(Message::Code::InvalidTime, "fri error") }),
    };
    const std::vector<Message> week {
        Message::info(Message::Code::TargetReachedBeforeFriday, "week info"),
        Message::error(Message::Code::ProjectionUnavailable, "week error"),
    };

    const auto messages = aggregateMessages(days, week);
    TEST_REQUIRE(messages.size() == 8);
    TEST_CHECK(messages[0].text == "wed error");
    TEST_CHECK(messages[1].text == "fri error");
    TEST_CHECK(messages[2].text == "week error");
    TEST_CHECK(messages[3].text == "mon warning");
    TEST_CHECK(messages[4].text == "wed warning 1");
    TEST_CHECK(messages[5].text == "wed warning 2");
    TEST_CHECK(messages[6].text == "mon info");
    TEST_CHECK(messages[7].text == "week info");
}

TEST_CASE("aggregateMessages with nothing to report")
{
    const std::vector<DayResult> days { dayWith(Weekday::Monday, {}) };
    TEST_CHECK(aggregateMessages(days, {}).empty());
}
