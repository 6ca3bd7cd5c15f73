#include "index.hpp"
#include "error.hpp"
#include "object_file.hpp"

#include <dwarf.h>

#include <map>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace {
std::string describe(const sof::dbg::struct_record &record) {
  std::ostringstream oss;
  oss << "struct ";
  if (record.name)
    oss << *record.name;
  else
    oss << "<anonymous@0x" << std::hex << record.offset << ">";
  return oss.str();
}
} // namespace

namespace sof::dbg {
// Lookup tables are filled in unit order, then in DIE pre-order within a
// unit. A later record with the same key replaces the earlier one and the
// tables are never touched after construction.
struct debug_info_index::impl {
  std::vector<compilation_unit> units;
  std::map<std::string, const struct_record *, std::less<>> structs_by_name;
  std::map<std::string, const typedef_record *, std::less<>> typedefs_by_name;
  std::unordered_map<uint64_t, const struct_record *> structs_by_offset;

  explicit impl(std::vector<compilation_unit> x) : units(std::move(x)) {
    for (const auto &cu : units) {
      for (const auto &td : cu.typedefs)
        if (td.name)
          typedefs_by_name[*td.name] = &td;
      for (const auto &s : cu.structs) {
        structs_by_offset[s.offset] = &s;
        if (s.name)
          structs_by_name[*s.name] = &s;
      }
    }
  }

  const struct_record *find(std::string_view name) const {
    if (auto it = structs_by_name.find(name); it != structs_by_name.end())
      return it->second;
    auto td = typedefs_by_name.find(name);
    if (td == typedefs_by_name.end())
      return nullptr;
    // a typedef of a typedef is not followed
    auto target = td->second->target_offset();
    if (!target)
      return nullptr;
    if (auto it = structs_by_offset.find(*target);
        it != structs_by_offset.end())
      return it->second;
    return nullptr;
  }
};

debug_info_index::debug_info_index(std::string_view path)
    : debug_info_index(read_compilation_units(path)) {}

debug_info_index::debug_info_index(std::vector<compilation_unit> units)
    : impl_(std::make_shared<impl>(std::move(units))) {}

const struct_record &
debug_info_index::resolve_struct(std::string_view name) const {
  if (!name.empty())
    if (const struct_record *record = impl_->find(name))
      return *record;
  throw exception(errc::struct_not_found, std::string(name));
}

const std::vector<compilation_unit> &
debug_info_index::compilation_units() const noexcept {
  return impl_->units;
}

size_t debug_info_index::struct_count() const noexcept {
  return impl_->structs_by_offset.size();
}

size_t debug_info_index::named_struct_count() const noexcept {
  return impl_->structs_by_name.size();
}

size_t debug_info_index::typedef_count() const noexcept {
  return impl_->typedefs_by_name.size();
}

member_offset to_member_offset(const struct_record &record,
                               const child_record &child) {
  if (child.tag != DW_TAG_member)
    throw exception(errc::unexpected_child_kind,
                    describe(record) + ": " + tag_name(child.tag));
  if (!child.name)
    throw exception(errc::missing_member_name, describe(record));
  if (!child.location)
    throw exception(errc::missing_member_offset,
                    describe(record) + ": member " + *child.name);
  if (auto offset = std::get_if<uint64_t>(&*child.location))
    return {*child.name, *offset};
  throw exception(errc::unsupported_member_location,
                  describe(record) + ": member " + *child.name);
}

bool operator==(const member_offset &lhs, const member_offset &rhs) noexcept {
  return lhs.offset == rhs.offset && lhs.name == rhs.name;
}

member_range::iterator::iterator(
    const struct_record &record,
    std::vector<child_record>::const_iterator it) noexcept
    : _record(&record), _it(it) {}

member_offset member_range::iterator::operator*() const {
  return to_member_offset(*_record, *_it);
}

member_range::iterator &member_range::iterator::operator++() noexcept {
  ++_it;
  return *this;
}

member_range::iterator member_range::iterator::operator++(int) noexcept {
  iterator tmp = *this;
  ++_it;
  return tmp;
}

bool member_range::iterator::operator==(const iterator &other) const noexcept {
  return _record == other._record && _it == other._it;
}

bool member_range::iterator::operator!=(const iterator &other) const noexcept {
  return !(*this == other);
}

member_range::member_range(const struct_record &record) noexcept
    : _record(&record) {}

member_range::iterator member_range::begin() const noexcept {
  return {*_record, _record->children.begin()};
}

member_range::iterator member_range::end() const noexcept {
  return {*_record, _record->children.end()};
}

std::vector<member_offset> member_range::collect() const {
  std::vector<member_offset> retval;
  retval.reserve(_record->children.size());
  for (auto &&member : *this)
    retval.push_back(std::move(member));
  return retval;
}

member_range members(const struct_record &record) noexcept {
  return member_range{record};
}
} // namespace sof::dbg
