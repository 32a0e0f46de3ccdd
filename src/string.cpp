#include "string.hpp"

#include <array>
#include <cassert>

constexpr std::array<char, 256> getToLowerTable()
{
    std::array<char, 256> table = {};
    for (size_t i = 0; i < 256; ++i) {
        table[i] = static_cast<char>(static_cast<uint8_t>(i));
        if (i >= 'A' && i <= 'Z') {
            table[i] -= 'A' - 'a';
        }
    }
    return table;
}

char toLower(char c)
{
    static auto table = getToLowerTable();
    return table[static_cast<uint8_t>(c)];
}

bool ciEqual(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (toLower(a[i]) != toLower(b[i])) {
            return false;
        }
    }
    return true;
}

bool isWhitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

std::string_view trim(std::string_view str)
{
    if (str.empty()) {
        return str;
    }

    size_t start = 0;
    while (start < str.size() && isWhitespace(str[start])) {
        start++;
    }
    if (start == str.size()) {
        return str.substr(start, 0);
    }
    assert(start < str.size());

    auto end = str.size() - 1;
    while (end > start && isWhitespace(str[end])) {
        end--;
    }

    return str.substr(start, end + 1 - start);
}

std::string rjust(std::string_view str, size_t length, char ch)
{
    std::string ret;
    if (str.size() < length) {
        ret.append(length - str.size(), ch);
    }
    ret.append(str);
    return ret;
}

std::string ljust(std::string_view str, size_t length, char ch)
{
    std::string ret(str);
    if (ret.size() < length) {
        ret.append(length - ret.size(), ch);
    }
    return ret;
}
