#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// NO. LOCALES.
char toLower(char c);

bool ciEqual(std::string_view a, std::string_view b);

bool isWhitespace(char c);
bool isDigit(char c);

std::string_view trim(std::string_view str);

template <typename T = uint64_t>
std::optional<T> parseInt(std::string_view str, int base = 10)
{
    const auto first = str.data();
    const auto last = first + str.size();
    T value;
    const auto res = std::from_chars(first, last, value, base);
    if (res.ec == std::errc() && res.ptr == last) {
        return value;
    } else {
        return std::nullopt;
    }
}

std::string rjust(std::string_view str, size_t length, char ch);
std::string ljust(std::string_view str, size_t length, char ch = ' ');
