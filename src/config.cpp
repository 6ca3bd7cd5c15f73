// config.cpp

#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include <nonstd/expected.hpp>
#include <pugixml.hpp>

static constexpr std::string_view error_messages[] = {
    "I/O error when loading config file",
    "Config file not found",
    "Out of memory when loading config file",
    "Config file is badly formatted",
    "Node <config></config> not found",
    "package: must be a dot-separated list of identifiers",
    "format: must be 'java' or 'json'",

    "Node <structs></structs> not found",
    "structs: must contain at least one <struct/>",

    "struct: attribute 'name' not found",
    "struct: invalid name: must be a C identifier",
    "struct: invalid output: cannot be empty",
    "struct: struct already listed",
    "struct: output file already used by another struct",
};

static_assert(
    static_cast<size_t>(sof::cfg::errc::struct_output_already_exists) ==
        sizeof(error_messages) / sizeof(error_messages[0]),
    "cfg::errc number of entries does not match message array size");

namespace {
template <typename T> using result = nonstd::expected<T, std::error_code>;

struct config_category_t : std::error_category {
  const char *name() const noexcept override { return "config"; }

  std::string message(int ev) const override {
    using sof::cfg::errc;
    auto ec = static_cast<errc>(ev);
    if (ec >= errc::config_io_error && ec <= errc::struct_output_already_exists)
      return std::string(error_messages[ev - 1]);
    return "(unrecognized error code)";
  }
};

const config_category_t config_category_v;

std::string trim(std::string_view txt) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto first = std::find_if(txt.begin(), txt.end(), not_space);
  auto last = std::find_if(txt.rbegin(), txt.rend(), not_space).base();
  if (first >= last)
    return {};
  return std::string(first, last);
}

result<std::optional<std::string>> get_package(const pugi::xml_node &nconfig) {
  using sof::cfg::errc;
  using rettype = decltype(get_package(std::declval<decltype(nconfig)>()));
  pugi::xml_node npackage = nconfig.child("package");
  if (!npackage)
    return std::nullopt;
  std::string package = trim(npackage.child_value());
  if (!sof::is_package_name(package))
    return rettype(nonstd::unexpect, errc::config_invalid_package);
  return package;
}

result<std::optional<sof::output_format>>
get_format(const pugi::xml_node &nconfig) {
  using sof::cfg::errc;
  using rettype = decltype(get_format(std::declval<decltype(nconfig)>()));
  pugi::xml_node nformat = nconfig.child("format");
  if (!nformat)
    return std::nullopt;
  if (auto fmt = sof::parse_output_format(trim(nformat.child_value())))
    return fmt;
  return rettype(nonstd::unexpect, errc::config_invalid_format);
}

std::optional<std::string> get_header(const pugi::xml_node &nconfig) {
  pugi::xml_node nheader = nconfig.child("header");
  if (!nheader)
    return std::nullopt;
  return std::string(nheader.child_value());
}
} // namespace

namespace sof::cfg {
struct config_entry {
  pugi::xml_node node;

  explicit operator bool() const noexcept { return bool(node); }
};

std::error_code make_error_code(errc x) noexcept {
  return {static_cast<int>(x), config_category()};
}

const std::error_category &config_category() noexcept {
  return config_category_v;
}

struct_t::struct_t(const config_entry &entry) {
  pugi::xml_attribute aname = entry.node.attribute("name");
  if (!aname)
    throw exception(errc::struct_no_name);
  name = trim(aname.value());
  if (!is_identifier(name))
    throw exception(errc::struct_invalid_name);
  if (pugi::xml_attribute aoutput = entry.node.attribute("output")) {
    std::string out = trim(aoutput.value());
    if (out.empty())
      throw exception(errc::struct_invalid_output);
    output = std::move(out);
  }
}

std::filesystem::path struct_t::output_path(output_format fmt) const {
  if (output)
    return *output;
  return name + std::string(file_extension(fmt));
}

struct config_t::impl {
  std::optional<std::string> package;
  std::optional<std::string> header;
  std::optional<output_format> format;
  std::vector<struct_t> structs;

  explicit impl(std::istream &);
};

config_t::impl::impl(std::istream &is) {
  using namespace pugi;
  xml_document doc;
  xml_parse_result parse_result = doc.load(is);
  if (!parse_result) {
    switch (parse_result.status) {
    case status_file_not_found:
      throw exception(errc::config_not_found);
    case status_io_error:
      throw exception(errc::config_io_error);
    case status_out_of_memory:
      throw exception(errc::config_out_of_mem);
    default:
      throw exception(errc::config_bad_format);
    }
  }
  // <config></config>
  xml_node nconfig = doc.child("config");
  if (!nconfig)
    throw exception(errc::config_no_config);
  // <package></package> - optional
  auto res_package = get_package(nconfig);
  if (!res_package)
    throw exception(res_package.error());
  package = std::move(*res_package);
  // <format></format> - optional
  auto res_format = get_format(nconfig);
  if (!res_format)
    throw exception(res_format.error());
  format = *res_format;
  // <header></header> - optional
  header = get_header(nconfig);
  // <structs></structs>
  xml_node nstructs = nconfig.child("structs");
  if (!nstructs)
    throw exception(errc::config_no_structs);
  for (config_entry nstruct{nstructs.child("struct")}; nstruct;
       nstruct = config_entry{nstruct.node.next_sibling("struct")}) {
    struct_t entry(nstruct);
    auto same_name = [&entry](const struct_t &s) { return s.name == entry.name; };
    if (std::any_of(structs.begin(), structs.end(), same_name))
      throw exception(errc::struct_already_exists);
    auto same_output = [&entry](const struct_t &s) {
      return entry.output && s.output && *s.output == *entry.output;
    };
    if (std::any_of(structs.begin(), structs.end(), same_output))
      throw exception(errc::struct_output_already_exists);
    structs.push_back(std::move(entry));
  }
  if (structs.empty())
    throw exception(errc::structs_empty);
}

config_t::config_t(std::istream &is) : _impl(std::make_shared<impl>(is)) {}

const std::optional<std::string> &config_t::package() const noexcept {
  return _impl->package;
}

const std::optional<std::string> &config_t::header() const noexcept {
  return _impl->header;
}

const std::optional<output_format> &config_t::format() const noexcept {
  return _impl->format;
}

const std::vector<struct_t> &config_t::structs() const noexcept {
  return _impl->structs;
}

std::vector<std::filesystem::path>
config_t::output_paths(output_format fmt,
                       const std::filesystem::path &dir) const {
  std::vector<std::filesystem::path> paths;
  paths.reserve(_impl->structs.size());
  for (const auto &s : _impl->structs) {
    std::filesystem::path path = s.output_path(fmt);
    if (path.is_relative())
      path = dir / path;
    path = path.lexically_normal();
    if (std::find(paths.begin(), paths.end(), path) != paths.end())
      throw exception(errc::struct_output_already_exists);
    paths.push_back(std::move(path));
  }
  return paths;
}

std::ostream &operator<<(std::ostream &os, const struct_t &s) {
  os << s.name;
  if (s.output)
    os << " -> " << s.output->native();
  return os;
}

std::ostream &operator<<(std::ostream &os, const config_t &cfg) {
  os << "package: " << (cfg.package() ? *cfg.package() : "n/a");
  os << ", format: ";
  if (cfg.format())
    os << *cfg.format();
  else
    os << "n/a";
  os << ", header: " << (cfg.header() ? "yes" : "no");
  os << ", structs:";
  for (const auto &s : cfg.structs())
    os << "\n  " << s;
  return os;
}
} // namespace sof::cfg
