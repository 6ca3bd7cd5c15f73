#pragma once

#include <cstdint>

namespace sof::dbg {
enum class errc : uint32_t;
enum class error_cause : uint32_t;

struct unsupported_location;
struct child_record;
struct struct_record;
struct typedef_record;
struct compilation_unit;

struct member_offset;
class member_range;
class debug_info_index;
} // namespace sof::dbg
