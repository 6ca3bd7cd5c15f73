#pragma once

#include "dwarf.hpp"
#include "common.hpp"

namespace sof::dbg
{
    struct child_record::param
    {
        Dwarf_Die& die;
    };

    struct struct_record::param
    {
        Dwarf_Die& die;
    };

    struct typedef_record::param
    {
        Dwarf_Die& die;
        uint64_t unit_offset;
    };

    struct compilation_unit::param
    {
        Dwarf_Die& cu_die;
    };

} // namespace sof::dbg
