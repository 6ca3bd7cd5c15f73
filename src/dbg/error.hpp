#pragma once

#include <cstdint>
#include <system_error>

namespace sof::dbg
{
    enum class errc : uint32_t;
    enum class error_cause : uint32_t;
}

namespace std
{
    template<> struct is_error_code_enum<sof::dbg::errc> : std::true_type {};
    template<> struct is_error_condition_enum<sof::dbg::error_cause> : std::true_type {};
}

namespace sof::dbg
{
    enum class errc : uint32_t
    {
        not_an_elf_object = 1,
        no_debug_info,
        struct_not_found,
        missing_member_name,
        missing_member_offset,
        unsupported_member_location,
        unexpected_child_kind,
        unknown,
    };

    enum class error_cause : uint32_t
    {
        elf_error = 1,
        dwarf_error,
        custom_error,
        unknown,
    };

    struct exception : std::system_error
    {
    public:
        using system_error::system_error;
    };

    const std::error_category& generic_category() noexcept;
    const std::error_category& dwarf_category() noexcept;
    const std::error_category& dwfl_category() noexcept;
    const std::error_category& elf_category() noexcept;

    std::error_code make_error_code(errc) noexcept;
    std::error_condition make_error_condition(error_cause) noexcept;
} // namespace sof::dbg
