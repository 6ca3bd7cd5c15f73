// output.hpp

#pragma once

#include "layout.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace sof
{
    enum class output_format
    {
        java,
        json,
    };

    struct output_options
    {
        output_format format = output_format::java;
        std::optional<std::string> package;
        std::optional<std::string> header;
    };

    std::optional<output_format> parse_output_format(std::string_view) noexcept;
    std::string_view file_extension(output_format) noexcept;

    void write_layout(std::ostream&, const struct_layout&, const output_options&);

    std::ostream& operator<<(std::ostream&, output_format);
}
