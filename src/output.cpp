// output.cpp

#include "output.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

using namespace sof;

namespace
{
    void write_header(std::ostream& os, const std::optional<std::string>& header)
    {
        if (!header || header->empty())
            return;
        os << *header;
        if (header->back() != '\n')
            os << '\n';
    }

    void write_java(std::ostream& os, const struct_layout& layout, const output_options& opts)
    {
        write_header(os, opts.header);
        if (opts.package)
            os << "package " << *opts.package << ";\n\n";
        os << "final class " << layout.name << " {\n";
        for (const auto& m : layout.members)
            os << "  public static final int " << m.name << " = " << to_hex_string(m.offset) << ";\n";
        os << "}\n";
    }

    void write_json(std::ostream& os, const struct_layout& layout, const output_options&)
    {
        nlohmann::json j;
        j["name"] = layout.name;
        if (layout.struct_name)
            j["struct"] = *layout.struct_name;
        else
            j["struct"] = nullptr;
        if (layout.size)
            j["size"] = *layout.size;
        auto& members = j["members"] = nlohmann::json::array();
        for (const auto& m : layout.members)
        {
            nlohmann::json member;
            member["name"] = m.name;
            member["offset"] = to_hex_string(m.offset);
            members.push_back(std::move(member));
        }
        os << j.dump(2) << "\n";
    }
}

std::optional<output_format> sof::parse_output_format(std::string_view str) noexcept
{
    if (str == "java")
        return output_format::java;
    if (str == "json")
        return output_format::json;
    return std::nullopt;
}

std::string_view sof::file_extension(output_format fmt) noexcept
{
    switch (fmt)
    {
    case output_format::java:
        return ".java";
    case output_format::json:
        return ".json";
    }
    return "";
}

void sof::write_layout(std::ostream& os, const struct_layout& layout, const output_options& opts)
{
    switch (opts.format)
    {
    case output_format::java:
        write_java(os, layout, opts);
        break;
    case output_format::json:
        write_json(os, layout, opts);
        break;
    }
}

std::ostream& sof::operator<<(std::ostream& os, output_format fmt)
{
    switch (fmt)
    {
    case output_format::java:
        os << "java";
        break;
    case output_format::json:
        os << "json";
        break;
    }
    return os;
}
