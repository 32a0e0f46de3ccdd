#pragma once

#include <vector>

#include "day.hpp"
#include "message.hpp"

// Collects every message of every day and the week-level messages without dropping any.
// Ordered by severity (errors first), then Monday to Friday, then week-level messages.
std::vector<Message> aggregateMessages(
    const std::vector<DayResult>& days, const std::vector<Message>& weekMessages);
