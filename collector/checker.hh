//
// Created by jason on 2022/10/13.
//

#pragma once

#include <functional>
#include <memory>
#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>
#include <string>
#include <vector>

#include "protocol/status.hh"
#include "util/seastarx.hh"
#include "util/types.hh"

namespace vigil::collector {

using deadline_t = seastar::lowres_clock::time_point;

// A local probe. run() should return before the deadline, a checker that
// does not is abandoned and reported as timed out.
class checker {
 public:
  virtual ~checker() = default;
  virtual std::string name() const = 0;
  virtual future<protocol::probe_result> run(
      protocol::cluster_member self, deadline_t deadline) = 0;
};

class function_checker final : public checker {
 public:
  using func_t = std::function<future<protocol::probe_result>(
      protocol::cluster_member, deadline_t)>;

  function_checker(std::string name, func_t func)
    : _name(std::move(name)), _func(std::move(func)) {}

  std::string name() const override { return _name; }

  future<protocol::probe_result> run(
      protocol::cluster_member self, deadline_t deadline) override {
    return _func(std::move(self), deadline);
  }

 private:
  std::string _name;
  func_t _func;
};

// Checkers known to this agent in registration order. Built once at
// startup and handed to the collector.
class registry {
 public:
  registry() = default;
  DISALLOW_COPY_AND_ASSIGN(registry);

  // throws invalid_argument on a duplicate name
  registry& add(std::unique_ptr<checker> c);
  registry& add(std::string name, function_checker::func_t func);

  bool contains(std::string_view name) const;
  size_t size() const noexcept { return _checkers.size(); }
  bool empty() const noexcept { return _checkers.empty(); }

  const std::vector<std::unique_ptr<checker>>& checkers() const noexcept {
    return _checkers;
  }

 private:
  std::vector<std::unique_ptr<checker>> _checkers;
};

}  // namespace vigil::collector
