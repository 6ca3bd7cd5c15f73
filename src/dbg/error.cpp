#include "error.hpp"

#include <elfutils/libdw.h>
#include <elfutils/libdwfl.h>
#include <libelf.h>

namespace
{
    struct generic_category_t : std::error_category
    {
        const char* name() const noexcept override;
        std::string message(int) const override;
        std::error_condition default_error_condition(int) const noexcept override;
    };

    struct dwarf_category_t : std::error_category
    {
        const char* name() const noexcept override;
        std::string message(int) const override;
        std::error_condition default_error_condition(int) const noexcept override;
    };

    struct dwfl_category_t : std::error_category
    {
        const char* name() const noexcept override;
        std::string message(int) const override;
        std::error_condition default_error_condition(int) const noexcept override;
    };

    struct elf_category_t : std::error_category
    {
        const char* name() const noexcept override;
        std::string message(int) const override;
        std::error_condition default_error_condition(int) const noexcept override;
    };

    struct error_cause_category_t : std::error_category
    {
        const char* name() const noexcept override;
        std::string message(int) const override;
        bool equivalent(const std::error_code&, int) const noexcept override;
    };

    const generic_category_t generic_category_v;
    const dwarf_category_t dwarf_category_v;
    const dwfl_category_t dwfl_category_v;
    const elf_category_t elf_category_v;
    const error_cause_category_t error_cause_category_v;

    const char* generic_category_t::name() const noexcept
    {
        return "structoff";
    }

    std::string generic_category_t::message(int ev) const
    {
        using sof::dbg::errc;
        switch (static_cast<errc>(ev))
        {
        case errc::not_an_elf_object:
            return "Not an ELF object";
        case errc::no_debug_info:
            return "file does not contain debug information";
        case errc::struct_not_found:
            return "could not find struct";
        case errc::missing_member_name:
            return "struct member without a name";
        case errc::missing_member_offset:
            return "struct member without a data member location";
        case errc::unsupported_member_location:
            return "struct member location is not a constant byte offset";
        case errc::unexpected_child_kind:
            return "unknown child of struct DIE";
        case errc::unknown:
            return "Unknown error";
        }
        return "(unrecognized error code)";
    }

    std::error_condition generic_category_t::default_error_condition(int ev) const noexcept
    {
        using sof::dbg::errc;
        using sof::dbg::error_cause;
        auto ec = static_cast<errc>(ev);
        return ec >= errc::not_an_elf_object && ec <= errc::unknown ?
            error_cause::custom_error :
            error_cause::unknown;
    }

    const char* dwarf_category_t::name() const noexcept
    {
        return "libdw";
    }

    std::string dwarf_category_t::message(int ev) const
    {
        const char* msg = dwarf_errmsg(ev);
        return msg ? msg : "unknown libdw error";
    }

    std::error_condition dwarf_category_t::default_error_condition(int) const noexcept
    {
        return sof::dbg::error_cause::dwarf_error;
    }

    const char* dwfl_category_t::name() const noexcept
    {
        return "libdwfl";
    }

    std::string dwfl_category_t::message(int ev) const
    {
        const char* msg = dwfl_errmsg(ev);
        return msg ? msg : "unknown libdwfl error";
    }

    std::error_condition dwfl_category_t::default_error_condition(int) const noexcept
    {
        return sof::dbg::error_cause::dwarf_error;
    }

    const char* elf_category_t::name() const noexcept
    {
        return "libelf";
    }

    std::string elf_category_t::message(int ev) const
    {
        const char* msg = elf_errmsg(ev);
        return msg ? msg : "unknown libelf error";
    }

    std::error_condition elf_category_t::default_error_condition(int) const noexcept
    {
        return sof::dbg::error_cause::elf_error;
    }

    const char* error_cause_category_t::name() const noexcept
    {
        return "error-cause";
    }

    std::string error_cause_category_t::message(int ev) const
    {
        using sof::dbg::error_cause;
        switch (static_cast<error_cause>(ev))
        {
        case error_cause::elf_error:
            return "ELF library error";
        case error_cause::dwarf_error:
            return "malformed debug information";
        case error_cause::custom_error:
            return "Custom error";
        case error_cause::unknown:
            return "Unknown cause";
        }
        return "(unrecognized error cause)";
    }

    bool error_cause_category_t::equivalent(const std::error_code& ec, int cv) const noexcept
    {
        using sof::dbg::error_cause;
        auto cond = static_cast<error_cause>(cv);
        if (ec.category() == sof::dbg::generic_category())
            return cond == error_cause::custom_error;
        if (ec.category() == sof::dbg::elf_category())
            return cond == error_cause::elf_error;
        if (ec.category() == sof::dbg::dwarf_category() ||
            ec.category() == sof::dbg::dwfl_category())
            return cond == error_cause::dwarf_error;
        return false;
    }

}

namespace sof
{
    namespace dbg
    {
        const std::error_category& generic_category() noexcept
        {
            return generic_category_v;
        }

        const std::error_category& dwarf_category() noexcept
        {
            return dwarf_category_v;
        }

        const std::error_category& dwfl_category() noexcept
        {
            return dwfl_category_v;
        }

        const std::error_category& elf_category() noexcept
        {
            return elf_category_v;
        }

        std::error_code make_error_code(errc x) noexcept
        {
            return { static_cast<int>(x), generic_category() };
        }

        std::error_condition make_error_condition(error_cause x) noexcept
        {
            return { static_cast<int>(x), error_cause_category_v };
        }
    } // namespace dbg
} // namespace sof
