// layout.hpp

#pragma once

#include "dbg/index.hpp"

#include <nonstd/expected.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sof
{
    struct layout_error
    {
        std::error_code code;
        std::string message;

        layout_error(std::error_code c, std::string msg);
    };

    struct struct_layout
    {
        // name the layout was requested by; a typedef name when resolved through one
        std::string name;
        std::optional<std::string> struct_name;
        std::optional<uint64_t> size;
        std::vector<dbg::member_offset> members;
    };

    template<typename R>
    using layout_expected = nonstd::expected<R, layout_error>;

    layout_expected<struct_layout>
        extract_layout(const dbg::debug_info_index& index, std::string_view name);

    // every name resolved, or the first failure in the order given
    layout_expected<std::vector<struct_layout>>
        extract_layouts(const dbg::debug_info_index& index,
            const std::vector<std::string>& names);

    std::ostream& operator<<(std::ostream&, const layout_error&);
    std::ostream& operator<<(std::ostream&, const struct_layout&);
}
