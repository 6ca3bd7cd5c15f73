#pragma once

#include "fwd.hpp"

#include <iosfwd>

namespace sof::dbg {
struct debug_dump {
  const debug_info_index &index;

  explicit debug_dump(const debug_info_index &) noexcept;
  debug_dump(const debug_dump &) = delete;
  debug_dump &operator=(const debug_dump &) = delete;
};

std::ostream &operator<<(std::ostream &, const debug_dump &);
} // namespace sof::dbg
