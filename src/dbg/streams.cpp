#include "dwarf.hpp"
#include "index.hpp"

#include <iomanip>
#include <iostream>

namespace sof::dbg {

std::ostream &operator<<(std::ostream &os, const unsupported_location &x) {
  std::ios::fmtflags flags(os.flags());
  os << "<form 0x" << std::hex << x.form << ">";
  os.flags(flags);
  return os;
}

std::ostream &operator<<(std::ostream &os, const child_record &x) {
  std::ios::fmtflags flags(os.flags());
  os << tag_name(x.tag);
  if (x.name)
    os << " " << *x.name;
  if (x.location) {
    if (auto offset = std::get_if<uint64_t>(&*x.location))
      os << " @0x" << std::hex << *offset;
    else
      os << " @" << std::get<unsupported_location>(*x.location);
  }
  os.flags(flags);
  return os;
}

std::ostream &operator<<(std::ostream &os, const struct_record &x) {
  std::ios::fmtflags flags(os.flags());
  os << "0x" << std::hex << x.offset << std::dec << " struct ";
  os << (x.name ? *x.name : "<anonymous>");
  if (x.byte_size)
    os << " size=" << *x.byte_size;
  os.flags(flags);
  for (const auto &child : x.children)
    os << "\n      " << child;
  return os;
}

std::ostream &operator<<(std::ostream &os, const typedef_record &x) {
  std::ios::fmtflags flags(os.flags());
  os << "0x" << std::hex << x.offset << " typedef ";
  os << (x.name ? *x.name : "<anonymous>");
  if (auto target = x.target_offset())
    os << " -> 0x" << *target;
  else
    os << " -> void";
  os.flags(flags);
  return os;
}

std::ostream &operator<<(std::ostream &os, const compilation_unit &x) {
  std::ios::fmtflags flags(os.flags());
  os << "0x" << std::hex << x.offset << std::dec << " " << x.path.native();
  os << " (" << x.structs.size() << " structs, " << x.typedefs.size()
     << " typedefs)";
  os.flags(flags);
  for (const auto &s : x.structs)
    os << "\n    " << s;
  for (const auto &td : x.typedefs)
    os << "\n    " << td;
  return os;
}

std::ostream &operator<<(std::ostream &os, const member_offset &x) {
  std::ios::fmtflags flags(os.flags());
  os << x.name << "@0x" << std::hex << x.offset;
  os.flags(flags);
  return os;
}

std::ostream &operator<<(std::ostream &os, const debug_info_index &x) {
  os << "units: " << x.compilation_units().size();
  os << ", structs: " << x.struct_count();
  os << " (" << x.named_struct_count() << " named)";
  os << ", typedefs: " << x.typedef_count();
  for (const auto &cu : x.compilation_units())
    os << "\n  " << cu;
  return os;
}

} // namespace sof::dbg
