//
// Created by jason on 2022/10/15.
//

#pragma once

#include <seastar/core/future.hh>
#include <string>
#include <variant>
#include <vector>

#include "util/seastarx.hh"

namespace vigil::timeline {

using argument = std::variant<int64_t, std::string>;

// The storage engine behind the timeline. Only inserts are ever issued,
// nothing is read back.
class execer {
 public:
  virtual ~execer() = default;
  virtual future<> exec(std::string stmt, std::vector<argument> args) = 0;
  virtual future<> close() { return make_ready_future<>(); }
};

}  // namespace vigil::timeline
