#pragma once

#include <string_view>
#include <vector>

#include "dwarf.hpp"

namespace sof::dbg
{
    // Parses every compilation unit of the ELF object at the given path.
    // Throws dbg::exception with errc::not_an_elf_object or errc::no_debug_info,
    // or with a libelf/libdw/libdwfl error when the debug sections are malformed.
    std::vector<compilation_unit> read_compilation_units(std::string_view path);
} // namespace sof::dbg
