#include <array-list/to_debug_string.hh>
#include <array-list/to_string.hh>

#include <nexus/test.hh>

#include <array>
#include <bit>
#include <cstdint>
#include <list>
#include <string>
#include <tuple>
#include <vector>

// =========================================================================================================
// Helper types for testing dispatch priorities
// =========================================================================================================

// Type with both ADL to_string AND iterability
struct HasAdlAndIterable
{
    std::vector<int> data = {10, 20, 30};

    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

std::string to_string(HasAdlAndIterable const&)
{
    return "ADL_to_string";
}

// Type with member to_string() AND iterability
struct HasMemberAndIterable
{
    std::vector<int> data = {40, 50};

    std::string to_string() const { return "member_to_string"; }
    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

// Opaque struct for memory dump fallback
struct OpaqueType
{
    uint32_t a;
    uint16_t b;
    uint8_t c;
};

// =========================================================================================================
// to_string
// =========================================================================================================

TEST("to_string - integers")
{
    CHECK(al::to_string(0) == "0");
    CHECK(al::to_string(-42) == "-42");
    CHECK(al::to_string(1234567890123LL) == "1234567890123");
    CHECK(al::to_string(18446744073709551615ULL) == "18446744073709551615");
    CHECK(al::to_string((signed char)-5) == "-5");
    CHECK(al::to_string((unsigned char)200) == "200");
    CHECK(al::to_string((short)-300) == "-300");
    CHECK(al::to_string((unsigned short)65535) == "65535");
}

TEST("to_string - floating point")
{
    CHECK(al::to_string(1.5f) == "1.5");
    CHECK(al::to_string(0.1) == "0.1");
    CHECK(al::to_string(-2.0) == "-2");
    CHECK(al::to_string(1e100) == "1e+100");
}

TEST("to_string - bool, char and byte")
{
    CHECK(al::to_string(true) == "true");
    CHECK(al::to_string(false) == "false");
    CHECK(al::to_string('x') == "x");
    CHECK(al::to_string(std::byte{0xAB}) == "0xAB");
    CHECK(al::to_string(std::byte{0x05}) == "0x05");
}

TEST("to_string - pointers")
{
    CHECK(al::to_string((void const*)nullptr) == "0x0");
    CHECK(al::to_string(reinterpret_cast<void const*>(std::uintptr_t(0xbeef))) == "0xbeef");
}

TEST("to_string - strings")
{
    CHECK(al::to_string("literal") == "literal");
    CHECK(al::to_string(std::string("owned")) == "owned");
    CHECK(al::to_string(std::string_view("view")) == "view");
}

// =========================================================================================================
// to_debug_string
// =========================================================================================================

TEST("to_debug_string - strings are quoted")
{
    CHECK(al::to_debug_string(std::string("hello")) == "\"hello\"");
    CHECK(al::to_debug_string(std::string_view("sv")) == "\"sv\"");
    CHECK(al::to_debug_string("lit") == "\"lit\"");
    CHECK(al::to_debug_string(std::string()) == "\"\"");
}

TEST("to_debug_string - chars are quoted and escaped")
{
    CHECK(al::to_debug_string('a') == "'a'");
    CHECK(al::to_debug_string('\n') == "'\\n'");
    CHECK(al::to_debug_string('\t') == "'\\t'");
    CHECK(al::to_debug_string('\0') == "'\\0'");
    CHECK(al::to_debug_string('\'') == "'\\''");
    CHECK(al::to_debug_string('\\') == "'\\\\'");
    CHECK(al::to_debug_string(char(1)) == "'\\x01'");
    CHECK(al::to_debug_string(char(127)) == "'\\x7F'");
}

TEST("to_debug_string - primitives use to_string")
{
    CHECK(al::to_debug_string(42) == "42");
    CHECK(al::to_debug_string(-7L) == "-7");
    CHECK(al::to_debug_string(true) == "true");
    CHECK(al::to_debug_string(2.5) == "2.5");
    CHECK(al::to_debug_string(std::byte{0xFF}) == "0xFF");
}

TEST("to_debug_string - ADL to_string takes precedence over iteration")
{
    CHECK(al::to_debug_string(HasAdlAndIterable{}) == "ADL_to_string");
}

TEST("to_debug_string - member to_string() takes precedence over iteration")
{
    CHECK(al::to_debug_string(HasMemberAndIterable{}) == "member_to_string");
}

TEST("to_debug_string - collections")
{
    SECTION("vector")
    {
        CHECK(al::to_debug_string(std::vector<int>{1, 2, 3}) == "[1, 2, 3]");
        CHECK(al::to_debug_string(std::vector<int>{}) == "[]");
    }

    SECTION("list of strings")
    {
        CHECK(al::to_debug_string(std::list<std::string>{"a", "b"}) == "[\"a\", \"b\"]");
    }

    SECTION("nested")
    {
        auto const nested = std::vector<std::vector<int>>{{1}, {2, 3}};
        CHECK(al::to_debug_string(nested) == "[[1], [2, 3]]");
    }

    SECTION("truncated after max_length")
    {
        auto values = std::vector<int>();
        for (int i = 0; i < 100; ++i)
            values.push_back(i);

        CHECK(al::to_debug_string(values, {.max_length = 10}) == "[0, 1, 2, 3, ...]");
    }
}

TEST("to_debug_string - tuples")
{
    CHECK(al::to_debug_string(std::pair<int, char>(1, 'x')) == "(1, 'x')");
    CHECK(al::to_debug_string(std::tuple<std::string, bool>("s", false)) == "(\"s\", false)");
    CHECK(al::to_debug_string(std::array<int, 2>{3, 4}) == "[3, 4]"); // iterable wins over tuple-like
}

TEST("to_debug_string - memory dump fallback")
{
    OpaqueType v;
    v.a = 0x04030201;
    v.b = 0x0605;
    v.c = 0x07;

    auto const s = al::to_debug_string(v);

    // little endian, '_' separates alignment groups, padding bytes are unspecified
    if constexpr (std::endian::native == std::endian::little)
        CHECK(s.starts_with("0x01020304_050607"));
    CHECK(s.size() == 2 + 2 * sizeof(OpaqueType) + 1);
}
