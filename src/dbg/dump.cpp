#include "dump.hpp"
#include "index.hpp"
#include "../util.hpp"

#include <nlohmann/json.hpp>

#include <ostream>

namespace sof::dbg {
debug_dump::debug_dump(const debug_info_index &x) noexcept : index(x) {}

static void to_json(nlohmann::json &j, const child_record &x) {
  j["tag"] = tag_name(x.tag);
  if (x.name)
    j["name"] = *x.name;
  if (x.location) {
    if (auto offset = std::get_if<uint64_t>(&*x.location))
      j["offset"] = to_hex_string(*offset);
    else
      j["unsupported_form"] =
          to_hex_string(std::get<unsupported_location>(*x.location).form);
  }
}

static void to_json(nlohmann::json &j, const struct_record &x) {
  j["offset"] = to_hex_string(x.offset);
  if (x.name)
    j["name"] = *x.name;
  if (x.byte_size)
    j["size"] = *x.byte_size;
  auto &children = j["children"] = nlohmann::json::array();
  for (const auto &c : x.children) {
    nlohmann::json child;
    to_json(child, c);
    children.push_back(std::move(child));
  }
}

static void to_json(nlohmann::json &j, const typedef_record &x) {
  j["offset"] = to_hex_string(x.offset);
  if (x.name)
    j["name"] = *x.name;
  if (auto target = x.target_offset())
    j["target"] = to_hex_string(*target);
  else
    j["target"] = nullptr;
}

static void to_json(nlohmann::json &j, const compilation_unit &x) {
  j["offset"] = to_hex_string(x.offset);
  j["path"] = x.path.native();
  auto &structs = j["structs"] = nlohmann::json::array();
  for (const auto &s : x.structs) {
    nlohmann::json record;
    to_json(record, s);
    structs.push_back(std::move(record));
  }
  auto &typedefs = j["typedefs"] = nlohmann::json::array();
  for (const auto &td : x.typedefs) {
    nlohmann::json record;
    to_json(record, td);
    typedefs.push_back(std::move(record));
  }
}

static void to_json(nlohmann::json &j, const debug_info_index &x) {
  auto &cus = j["compilation_units"] = nlohmann::json::array();
  for (const auto &cu : x.compilation_units()) {
    nlohmann::json unit;
    to_json(unit, cu);
    cus.push_back(std::move(unit));
  }
}

std::ostream &operator<<(std::ostream &os, const debug_dump &x) {
  nlohmann::json j;
  to_json(j, x.index);
  os << j;
  return os;
}
} // namespace sof::dbg
