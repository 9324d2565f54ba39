#include "to_string.hh"

#include <array-list/assert.hh>

#include <charconv>
#include <cstdint>
#include <system_error>
#include <type_traits>

namespace
{
template <class T>
std::string chars_of(T value, int base = 10)
{
    // large enough for 64 bit integers in base 16 and shortest round-trip doubles
    char buffer[64];
    std::to_chars_result res;
    if constexpr (std::is_floating_point_v<T>)
    {
        AL_UNUSED(base);
        res = std::to_chars(buffer, buffer + sizeof(buffer), value);
    }
    else
        res = std::to_chars(buffer, buffer + sizeof(buffer), value, base);

    AL_ASSERT_ALWAYS(res.ec == std::errc(), "buffer too small for number conversion");
    return std::string(buffer, res.ptr);
}

std::string hex_upper(unsigned long long value, int min_digits)
{
    auto s = chars_of(value, 16);
    for (auto& c : s)
        if ('a' <= c && c <= 'f')
            c = char(c - 'a' + 'A');
    if (int(s.size()) < min_digits)
        s.insert(s.begin(), min_digits - s.size(), '0');
    return s;
}
} // namespace

std::string al::to_string(void const* ptr)
{
    return "0x" + chars_of(reinterpret_cast<std::uintptr_t>(ptr), 16);
}

std::string al::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string al::to_string(byte b)
{
    return "0x" + hex_upper(static_cast<unsigned char>(b), 2);
}

std::string al::to_string(char c)
{
    return std::string(1, c);
}

std::string al::to_string(signed char i)
{
    return chars_of(int(i));
}

std::string al::to_string(unsigned char i)
{
    return chars_of(unsigned(i));
}

std::string al::to_string(signed short i)
{
    return chars_of(i);
}

std::string al::to_string(unsigned short i)
{
    return chars_of(i);
}

std::string al::to_string(signed int i)
{
    return chars_of(i);
}

std::string al::to_string(unsigned int i)
{
    return chars_of(i);
}

std::string al::to_string(signed long i)
{
    return chars_of(i);
}

std::string al::to_string(unsigned long i)
{
    return chars_of(i);
}

std::string al::to_string(signed long long i)
{
    return chars_of(i);
}

std::string al::to_string(unsigned long long i)
{
    return chars_of(i);
}

std::string al::to_string(float f)
{
    return chars_of(f);
}

std::string al::to_string(double f)
{
    return chars_of(f);
}

std::string al::to_string(char const* s)
{
    return {s};
}

std::string al::to_string(std::string s)
{
    return s;
}

std::string al::to_string(std::string_view s)
{
    return std::string(s);
}
