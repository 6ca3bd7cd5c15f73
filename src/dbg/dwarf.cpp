#include "common.hpp"
#include "dwarf.hpp"
#include "error.hpp"
#include "params_structs.hpp"

#include <dwarf.h>

#include <sstream>
#include <utility>

namespace
{
    template<typename Func>
    void for_each_child(Dwarf_Die& parent, Func&& func)
    {
        using sof::dbg::exception;
        using sof::dbg::dwarf_category;
        Dwarf_Die child;
        int res = dwarf_child(&parent, &child);
        while (res == 0)
        {
            func(child);
            res = dwarf_siblingof(&child, &child);
        }
        if (res < 0)
            throw exception(dwarf_errno(), dwarf_category());
    }

    std::optional<std::string> get_name(Dwarf_Die& die)
    {
        using sof::dbg::exception;
        using sof::dbg::dwarf_category;
        Dwarf_Attribute attr;
        if (!dwarf_attr(&die, DW_AT_name, &attr))
            return std::nullopt;
        if (const char* str = dwarf_formstring(&attr))
            return str;
        throw exception(dwarf_errno(), dwarf_category());
    }

    sof::dbg::member_location get_member_location(Dwarf_Attribute& attr)
    {
        using sof::dbg::exception;
        using sof::dbg::dwarf_category;
        using sof::dbg::unsupported_location;
        unsigned int form = dwarf_whatform(&attr);
        switch (form)
        {
        case DW_FORM_data1:
        case DW_FORM_data2:
        case DW_FORM_data4:
        case DW_FORM_data8:
        case DW_FORM_udata:
        case DW_FORM_sdata:
        case DW_FORM_implicit_const:
        {
            Dwarf_Word val;
            if (dwarf_formudata(&attr, &val) != 0)
                throw exception(dwarf_errno(), dwarf_category());
            return val;
        }
        case DW_FORM_block1:
        case DW_FORM_block2:
        case DW_FORM_block4:
        case DW_FORM_block:
        case DW_FORM_exprloc:
        {
            // DWARF 2 producers encode the offset as DW_OP_plus_uconst <n>
            Dwarf_Op* ops;
            size_t nops;
            if (dwarf_getlocation(&attr, &ops, &nops) != 0)
                throw exception(dwarf_errno(), dwarf_category());
            if (nops == 1 && ops[0].atom == DW_OP_plus_uconst)
                return ops[0].number;
            return unsupported_location{ form };
        }
        default:
            return unsupported_location{ form };
        }
    }

    std::filesystem::path build_path(Dwarf_Die& cu_die)
    {
        namespace fs = std::filesystem;
        Dwarf_Attribute attr;
        fs::path cu_path;
        if (const char* dir = dwarf_formstring(dwarf_attr(&cu_die, DW_AT_comp_dir, &attr)))
            cu_path = dir;
        if (const char* name = dwarf_formstring(dwarf_attr(&cu_die, DW_AT_name, &attr)))
            cu_path /= name;
        return cu_path;
    }
}

namespace sof::dbg
{
    child_record::child_record(uint32_t tag,
        std::optional<std::string> name,
        std::optional<member_location> location) :
        tag(tag),
        name(std::move(name)),
        location(std::move(location))
    {}

    child_record::child_record(const param& x) :
        tag(static_cast<uint32_t>(dwarf_tag(&x.die))),
        name(get_name(x.die))
    {
        Dwarf_Attribute attr;
        if (dwarf_attr(&x.die, DW_AT_data_member_location, &attr))
            location = get_member_location(attr);
    }

    struct_record::struct_record(uint64_t offset,
        std::optional<std::string> name,
        std::optional<uint64_t> byte_size,
        std::vector<child_record> children) :
        offset(offset),
        name(std::move(name)),
        byte_size(byte_size),
        children(std::move(children))
    {}

    struct_record::struct_record(const param& x) :
        offset(dwarf_dieoffset(&x.die)),
        name(get_name(x.die))
    {
        if (int size = dwarf_bytesize(&x.die); size >= 0)
            byte_size = static_cast<uint64_t>(size);
        for_each_child(x.die, [this](Dwarf_Die& child)
            {
                children.emplace_back(child_record::param{ child });
            });
    }

    typedef_record::typedef_record(uint64_t offset,
        uint64_t unit_offset,
        std::optional<std::string> name,
        std::optional<uint64_t> type_ref) :
        offset(offset),
        unit_offset(unit_offset),
        name(std::move(name)),
        type_ref(type_ref)
    {}

    typedef_record::typedef_record(const param& x) :
        offset(dwarf_dieoffset(&x.die)),
        unit_offset(x.unit_offset),
        name(get_name(x.die))
    {
        Dwarf_Attribute attr;
        if (!dwarf_attr(&x.die, DW_AT_type, &attr))
            return;
        Dwarf_Die target;
        if (!dwarf_formref_die(&attr, &target))
            throw exception(dwarf_errno(), dwarf_category());
        type_ref = dwarf_dieoffset(&target) - unit_offset;
    }

    std::optional<uint64_t> typedef_record::target_offset() const noexcept
    {
        if (!type_ref)
            return std::nullopt;
        return unit_offset + *type_ref;
    }

    compilation_unit::compilation_unit(uint64_t offset,
        std::filesystem::path path,
        container<struct_record> structs,
        container<typedef_record> typedefs) :
        offset(offset),
        path(std::move(path)),
        structs(std::move(structs)),
        typedefs(std::move(typedefs))
    {}

    compilation_unit::compilation_unit(const param& x) :
        offset(dwarf_dieoffset(&x.cu_die) - dwarf_cuoffset(&x.cu_die)),
        path(build_path(x.cu_die))
    {
        load_records(x);
    }

    void compilation_unit::load_records(const param& x)
    {
        // pre-order over the whole unit, nested scopes included
        auto visit = [this](auto& self, Dwarf_Die& parent) -> void
        {
            for_each_child(parent, [this, &self](Dwarf_Die& die)
                {
                    switch (dwarf_tag(&die))
                    {
                    case DW_TAG_structure_type:
                        structs.emplace_back(struct_record::param{ die });
                        break;
                    case DW_TAG_typedef:
                        typedefs.emplace_back(typedef_record::param{ die, offset });
                        break;
                    default:
                        break;
                    }
                    if (dwarf_haschildren(&die))
                        self(self, die);
                });
        };
        visit(visit, x.cu_die);
    }

    std::string tag_name(uint32_t tag)
    {
        switch (tag)
        {
        case DW_TAG_member:
            return "DW_TAG_member";
        case DW_TAG_structure_type:
            return "DW_TAG_structure_type";
        case DW_TAG_class_type:
            return "DW_TAG_class_type";
        case DW_TAG_union_type:
            return "DW_TAG_union_type";
        case DW_TAG_enumeration_type:
            return "DW_TAG_enumeration_type";
        case DW_TAG_typedef:
            return "DW_TAG_typedef";
        case DW_TAG_inheritance:
            return "DW_TAG_inheritance";
        case DW_TAG_subprogram:
            return "DW_TAG_subprogram";
        case DW_TAG_variable:
            return "DW_TAG_variable";
        case DW_TAG_template_type_parameter:
            return "DW_TAG_template_type_parameter";
        case DW_TAG_template_value_parameter:
            return "DW_TAG_template_value_parameter";
        case DW_TAG_array_type:
            return "DW_TAG_array_type";
        case DW_TAG_pointer_type:
            return "DW_TAG_pointer_type";
        case DW_TAG_base_type:
            return "DW_TAG_base_type";
        }
        std::ostringstream oss;
        oss << "DW_TAG_<0x" << std::hex << tag << ">";
        return oss.str();
    }
}
