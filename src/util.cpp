// util.cpp

#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <system_error>

std::string sof::to_hex_string(uint64_t value)
{
    char str[2 + 16];
    str[0] = '0';
    str[1] = 'x';
    auto [ptr, err] = std::to_chars(std::begin(str) + 2, std::end(str), value, 16);
    if (auto ec = std::make_error_code(err))
        throw std::system_error(ec, "Error converting value to hex string");
    return std::string(str, ptr);
}

std::string_view sof::program_name(const char* argv0) noexcept
{
    if (!argv0 || !*argv0)
        return "structoff";
    std::string_view name(argv0);
    if (auto pos = name.find_last_of('/'); pos != std::string_view::npos)
        name.remove_prefix(pos + 1);
    return name.empty() ? "structoff" : name;
}

bool sof::is_identifier(std::string_view str) noexcept
{
    if (str.empty())
        return false;
    if (!std::isalpha(static_cast<unsigned char>(str.front())) && str.front() != '_')
        return false;
    return std::all_of(str.begin(), str.end(), [](unsigned char c)
        {
            return std::isalnum(c) || c == '_';
        });
}

bool sof::is_package_name(std::string_view str) noexcept
{
    std::string_view::size_type current = 0;
    std::string_view::size_type next;
    while ((next = str.find('.', current)) != std::string_view::npos)
    {
        if (!is_identifier(str.substr(current, next - current)))
            return false;
        current = next + 1;
    }
    return is_identifier(str.substr(current));
}
