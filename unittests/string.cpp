#include "test.hpp"

#include "string.hpp"

TEST_CASE("trim")
{
    TEST_CHECK(trim("") == "");
    TEST_CHECK(trim("   ") == "");
    TEST_CHECK(trim(" \t8:00 AM\n") == "8:00 AM");
    TEST_CHECK(trim("60") == "60");
}

TEST_CASE("ciEqual")
{
    TEST_CHECK(ciEqual("PM", "pm"));
    TEST_CHECK(ciEqual("Am", "aM"));
    TEST_CHECK(!ciEqual("am", "a"));
}

TEST_CASE("parseInt")
{
    TEST_CHECK(parseInt<int>("42") == 42);
    TEST_CHECK(parseInt<int>("-5") == -5);
    TEST_CHECK(!parseInt<int>("5x"));
    TEST_CHECK(!parseInt<int>(""));
    TEST_CHECK(!parseInt<uint32_t>("-5"));
}

TEST_CASE("rjust and ljust")
{
    TEST_CHECK(rjust("5", 2, '0') == "05");
    TEST_CHECK(rjust("45", 2, '0') == "45");
    TEST_CHECK(ljust("ab", 4) == "ab  ");
    TEST_CHECK(ljust("abcdef", 4) == "abcdef");
}
