// util.hpp

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sof
{
    // lowercase hexadecimal with a 0x prefix, "0x0" for zero
    std::string to_hex_string(uint64_t value);

    // basename of argv[0], used as the prefix of fatal error messages
    std::string_view program_name(const char* argv0) noexcept;

    // letter or underscore, then letters, digits and underscores
    bool is_identifier(std::string_view str) noexcept;

    // one or more identifiers joined by single dots
    bool is_package_name(std::string_view str) noexcept;
}
