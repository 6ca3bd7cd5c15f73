#include "object_file.hpp"
#include "common.hpp"
#include "error.hpp"
#include "params_structs.hpp"

namespace {
std::vector<sof::dbg::compilation_unit>
load_debug_info(const sof::dbg::dwfl_descriptor &dwfl) {
  using sof::dbg::compilation_unit;
  using sof::dbg::dwarf_category;
  using sof::dbg::exception;
  std::vector<compilation_unit> units;
  Dwarf_Off offset = 0;
  while (true) {
    size_t hdr_size;
    Dwarf_Off prev_offset = offset;
    int res = dwarf_nextcu(dwfl.dwarf, offset, &offset, &hdr_size, nullptr,
                           nullptr, nullptr);
    if (res == -1)
      throw exception(dwarf_errno(), dwarf_category());
    if (res != 0)
      break;
    Dwarf_Die cu_die;
    if (!dwarf_offdie(dwfl.dwarf, prev_offset + hdr_size, &cu_die))
      throw exception(dwarf_errno(), dwarf_category());
    units.emplace_back(compilation_unit::param{cu_die});
  }
  return units;
}
} // namespace

namespace sof::dbg {
std::vector<compilation_unit> read_compilation_units(std::string_view path) {
  {
    ro_file_descriptor fd{path};
    elf_descriptor elf{fd};
    if (!has_debug_info(elf))
      throw exception(errc::no_debug_info);
  }
  return load_debug_info(dwfl_descriptor{path});
}
} // namespace sof::dbg
