//
// Created by jason on 2021/11/26.
//

#include "error.hh"

#include <iterator>

namespace vigil::util {

std::string_view status_string(enum code e) {
  static std::string_view s[] = {
      "ok",
      "panic",
      "configuration",
      "invalid_argument",
      "membership",
      "member_not_found",
      "closed",
      "timed_out",
      "no_data",
      "serialization",
      "short_write",
      "storage",
  };
  static_assert(std::size(s) == static_cast<int>(code::num_of_codes));
  return s[static_cast<uint8_t>(e)];
}

}  // namespace vigil::util
