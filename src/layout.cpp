// layout.cpp

#include "layout.hpp"
#include "log.hpp"
#include "dbg/error.hpp"

#include <cinttypes>
#include <iostream>

using namespace sof;

layout_error::layout_error(std::error_code c, std::string msg) :
    code(c),
    message(std::move(msg))
{}

layout_expected<struct_layout>
sof::extract_layout(const dbg::debug_info_index& index, std::string_view name)
{
    using rettype = layout_expected<struct_layout>;
    try
    {
        const dbg::struct_record& record = index.resolve_struct(name);
        log::logline(log::debug, "%.*s resolved to DIE at 0x%" PRIx64,
            static_cast<int>(name.size()), name.data(), record.offset);

        struct_layout layout{ std::string(name), record.name, record.byte_size, {} };
        layout.members = dbg::members(record).collect();
        log::logline(log::info, "%.*s: %zu members",
            static_cast<int>(name.size()), name.data(), layout.members.size());
        return layout;
    }
    catch (const dbg::exception& e)
    {
        return rettype(nonstd::unexpect, e.code(), e.what());
    }
}

layout_expected<std::vector<struct_layout>>
sof::extract_layouts(const dbg::debug_info_index& index,
    const std::vector<std::string>& names)
{
    using rettype = layout_expected<std::vector<struct_layout>>;
    std::vector<struct_layout> layouts;
    layouts.reserve(names.size());
    for (const auto& name : names)
    {
        auto layout = extract_layout(index, name);
        if (!layout)
            return rettype(nonstd::unexpect, std::move(layout.error()));
        layouts.push_back(std::move(*layout));
    }
    return layouts;
}

std::ostream& sof::operator<<(std::ostream& os, const layout_error& e)
{
    os << (e.message.empty() ? e.code.message() : e.message);
    return os;
}

std::ostream& sof::operator<<(std::ostream& os, const struct_layout& l)
{
    os << l.name;
    if (l.struct_name && *l.struct_name != l.name)
        os << " (struct " << *l.struct_name << ")";
    os << ":";
    for (const auto& m : l.members)
        os << " " << m;
    return os;
}
