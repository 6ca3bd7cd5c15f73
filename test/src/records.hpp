// records.hpp

#pragma once

#include "dbg/dwarf.hpp"

#include <dwarf.h>

#include <string>
#include <utility>
#include <vector>

namespace sof::test
{
    inline dbg::child_record member(std::string name, uint64_t offset)
    {
        return { DW_TAG_member, std::move(name), dbg::member_location{ offset } };
    }

    inline dbg::struct_record make_struct(uint64_t offset, std::optional<std::string> name,
        std::vector<dbg::child_record> children, std::optional<uint64_t> size = std::nullopt)
    {
        return { offset, std::move(name), size, std::move(children) };
    }

    inline dbg::typedef_record make_typedef(uint64_t offset, uint64_t unit_offset,
        std::optional<std::string> name, std::optional<uint64_t> type_ref)
    {
        return { offset, unit_offset, std::move(name), type_ref };
    }

    // struct Point { int x; int y; }; typedef struct Point Point_t;
    inline dbg::compilation_unit point_unit(uint64_t unit_offset = 0)
    {
        std::vector<dbg::struct_record> structs;
        structs.push_back(make_struct(unit_offset + 0x2d, "Point",
            { member("x", 0), member("y", 4) }, 8));
        std::vector<dbg::typedef_record> typedefs;
        typedefs.push_back(make_typedef(unit_offset + 0x50, unit_offset, "Point_t", 0x2d));
        return { unit_offset, "point.c", std::move(structs), std::move(typedefs) };
    }
}
