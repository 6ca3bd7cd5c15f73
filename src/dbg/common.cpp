#include "common.hpp"
#include "error.hpp"

#include <fcntl.h>
#include <gelf.h>
#include <unistd.h>

#include <cstring>
#include <iostream>
#include <string>
#include <system_error>

namespace {
// only the debug information inside the object itself is ever considered
int no_separate_debuginfo(Dwfl_Module *, void **, const char *, Dwarf_Addr,
                          const char *, const char *, GElf_Word, char **) {
  return -1;
}

const Dwfl_Callbacks offline_callbacks = {
    dwfl_build_id_find_elf,
    no_separate_debuginfo,
    dwfl_offline_section_address,
    nullptr,
};

constexpr std::string_view debug_info_sections[] = {
    ".debug_info",
    ".zdebug_info",
};
} // namespace

namespace sof::dbg {
ro_file_descriptor::ro_file_descriptor(std::string_view path)
    : value(open(std::string(path).c_str(), O_RDONLY)) {
  if (value == -1)
    throw std::system_error(errno, std::system_category(), std::string(path));
}

ro_file_descriptor::~ro_file_descriptor() {
  if (close(value) < 0) {
    std::cerr << "Error closing file descriptor: " << strerror(errno)
              << std::endl;
  }
}

elf_descriptor::elf_descriptor(ro_file_descriptor &fd) : value(nullptr) {
  if (elf_version(EV_CURRENT) == EV_NONE)
    throw exception(elf_errno(), elf_category());
  if (!(value = elf_begin(fd.value, ELF_C_READ, nullptr)))
    throw exception(elf_errno(), elf_category());
  if (elf_kind(value) != ELF_K_ELF) {
    elf_end(value);
    throw exception(errc::not_an_elf_object);
  }
}

elf_descriptor::~elf_descriptor() {
  if (elf_end(value) != 0) {
    std::cerr << "Error closing ELF context: " << elf_errmsg(-1) << std::endl;
  }
}

dwfl_descriptor::dwfl_descriptor(std::string_view path)
    : value(dwfl_begin(&offline_callbacks)), dwarf(nullptr) {
  if (!value)
    throw exception(dwfl_errno(), dwfl_category());
  std::string file(path);
  Dwfl_Module *module =
      dwfl_report_offline(value, file.c_str(), file.c_str(), -1);
  if (!module || dwfl_report_end(value, nullptr, nullptr) != 0) {
    int err = dwfl_errno();
    dwfl_end(value);
    throw exception(err, dwfl_category());
  }
  Dwarf_Addr bias;
  if (!(dwarf = dwfl_module_getdwarf(module, &bias))) {
    int err = dwfl_errno();
    dwfl_end(value);
    throw exception(err, dwfl_category());
  }
}

dwfl_descriptor::~dwfl_descriptor() { dwfl_end(value); }

bool has_debug_info(const elf_descriptor &elf) {
  size_t shstrndx;
  if (elf_getshdrstrndx(elf.value, &shstrndx) != 0)
    throw exception(elf_errno(), elf_category());
  for (Elf_Scn *scn = elf_nextscn(elf.value, nullptr); scn;
       scn = elf_nextscn(elf.value, scn)) {
    GElf_Shdr header;
    if (!gelf_getshdr(scn, &header))
      throw exception(elf_errno(), elf_category());
    // stripped into a separate file, the section header stays behind
    if (header.sh_type == SHT_NOBITS)
      continue;
    const char *name = elf_strptr(elf.value, shstrndx, header.sh_name);
    if (!name)
      throw exception(elf_errno(), elf_category());
    for (std::string_view candidate : debug_info_sections)
      if (candidate == name)
        return true;
  }
  return false;
}

} // namespace sof::dbg
