#include "aggregate.hpp"

#include <algorithm>
#include <tuple>

namespace {
struct Entry {
    size_t order;
    const Message* message;
};
}

std::vector<Message> aggregateMessages(
    const std::vector<DayResult>& days, const std::vector<Message>& weekMessages)
{
    std::vector<Entry> entries;
    for (const auto& day : days) {
        for (const auto& msg : day.messages) {
            entries.push_back(Entry { static_cast<size_t>(day.day), &msg });
        }
    }
    for (const auto& msg : weekMessages) {
        entries.push_back(Entry { weekdays.size(), &msg });
    }

    // stable, so messages of the same day and severity keep the order they were produced in
    std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return std::make_tuple(a.message->severity, a.order)
            < std::make_tuple(b.message->severity, b.order);
    });

    std::vector<Message> messages;
    messages.reserve(entries.size());
    for (const auto& entry : entries) {
        messages.push_back(*entry.message);
    }
    return messages;
}
