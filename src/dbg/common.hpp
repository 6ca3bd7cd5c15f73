#pragma once

#include <string_view>

#include <libelf.h>
#include <elfutils/libdw.h>
#include <elfutils/libdwfl.h>

namespace sof::dbg
{
    struct ro_file_descriptor
    {
        int value;
        explicit ro_file_descriptor(std::string_view);
        ~ro_file_descriptor();

        ro_file_descriptor(const ro_file_descriptor&) = delete;
        ro_file_descriptor& operator=(const ro_file_descriptor&) = delete;
    };

    struct elf_descriptor
    {
        Elf* value;
        explicit elf_descriptor(ro_file_descriptor&);
        ~elf_descriptor();

        elf_descriptor(const elf_descriptor&) = delete;
        elf_descriptor& operator=(const elf_descriptor&) = delete;
    };

    // offline libdwfl session over a single file; relocatable objects
    // get their debug sections relocated before the Dwarf handle is returned
    struct dwfl_descriptor
    {
        Dwfl* value;
        Dwarf* dwarf;
        explicit dwfl_descriptor(std::string_view);
        ~dwfl_descriptor();

        dwfl_descriptor(const dwfl_descriptor&) = delete;
        dwfl_descriptor& operator=(const dwfl_descriptor&) = delete;
    };

    bool has_debug_info(const elf_descriptor&);

} // namespace sof::dbg
