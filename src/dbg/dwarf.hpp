#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sof::dbg
{
    // a data member location that is neither a constant nor a lone
    // DW_OP_plus_uconst expression
    struct unsupported_location
    {
        uint32_t form;
    };

    using member_location = std::variant<uint64_t, unsupported_location>;

    struct child_record
    {
        uint32_t tag;
        std::optional<std::string> name;
        std::optional<member_location> location;

        child_record(uint32_t tag,
            std::optional<std::string> name,
            std::optional<member_location> location);

        struct param;
        explicit child_record(const param&);
    };

    struct struct_record
    {
        uint64_t offset;
        std::optional<std::string> name;
        std::optional<uint64_t> byte_size;
        std::vector<child_record> children;

        struct_record(uint64_t offset,
            std::optional<std::string> name,
            std::optional<uint64_t> byte_size,
            std::vector<child_record> children);

        struct param;
        explicit struct_record(const param&);
    };

    struct typedef_record
    {
        uint64_t offset;
        uint64_t unit_offset;
        std::optional<std::string> name;
        // relative to unit_offset, absent for 'typedef void'
        std::optional<uint64_t> type_ref;

        typedef_record(uint64_t offset,
            uint64_t unit_offset,
            std::optional<std::string> name,
            std::optional<uint64_t> type_ref);

        struct param;
        explicit typedef_record(const param&);

        std::optional<uint64_t> target_offset() const noexcept;
    };

    struct compilation_unit
    {
        template<typename T>
        using container = std::vector<T>;

        uint64_t offset;
        std::filesystem::path path;
        container<struct_record> structs;
        container<typedef_record> typedefs;

        compilation_unit(uint64_t offset,
            std::filesystem::path path,
            container<struct_record> structs,
            container<typedef_record> typedefs);

        struct param;
        explicit compilation_unit(const param&);

    private:
        void load_records(const param&);
    };

    // DW_TAG_<0x..> for tags without a known name
    std::string tag_name(uint32_t tag);

    std::ostream& operator<<(std::ostream&, const unsupported_location&);
    std::ostream& operator<<(std::ostream&, const child_record&);
    std::ostream& operator<<(std::ostream&, const struct_record&);
    std::ostream& operator<<(std::ostream&, const typedef_record&);
    std::ostream& operator<<(std::ostream&, const compilation_unit&);
} // namespace sof::dbg
