#pragma once

#include <cstddef>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "dwarf.hpp"

namespace sof::dbg
{
    struct member_offset
    {
        std::string name;
        uint64_t offset;
    };

    bool operator==(const member_offset&, const member_offset&) noexcept;

    // Lazy view over the direct children of a struct record.
    // Each child is validated when dereferenced; iterating twice reads the
    // same children again.
    class member_range
    {
    public:
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = member_offset;
            using difference_type = std::ptrdiff_t;
            using pointer = const member_offset*;
            using reference = member_offset;

            iterator(const struct_record&,
                std::vector<child_record>::const_iterator) noexcept;

            member_offset operator*() const;
            iterator& operator++() noexcept;
            iterator operator++(int) noexcept;

            bool operator==(const iterator&) const noexcept;
            bool operator!=(const iterator&) const noexcept;

        private:
            const struct_record* _record;
            std::vector<child_record>::const_iterator _it;
        };

        explicit member_range(const struct_record&) noexcept;

        iterator begin() const noexcept;
        iterator end() const noexcept;

        // all members or an exception, never a partial list
        std::vector<member_offset> collect() const;

    private:
        const struct_record* _record;
    };

    class debug_info_index
    {
    public:
        explicit debug_info_index(std::string_view path);
        explicit debug_info_index(std::vector<compilation_unit>);

        // direct struct names first, then typedefs one level deep;
        // throws errc::struct_not_found
        const struct_record& resolve_struct(std::string_view name) const;

        const std::vector<compilation_unit>& compilation_units() const noexcept;
        size_t struct_count() const noexcept;
        size_t named_struct_count() const noexcept;
        size_t typedef_count() const noexcept;

    private:
        struct impl;
        std::shared_ptr<const impl> impl_;
    };

    member_range members(const struct_record&) noexcept;

    member_offset to_member_offset(const struct_record&, const child_record&);

    std::ostream& operator<<(std::ostream&, const member_offset&);
    std::ostream& operator<<(std::ostream&, const debug_info_index&);
} // namespace sof::dbg
