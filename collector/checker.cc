//
// Created by jason on 2022/10/13.
//

#include "checker.hh"

#include "util/error.hh"

namespace vigil::collector {

registry& registry::add(std::unique_ptr<checker> c) {
  if (!c) {
    throw util::invalid_argument("checker", "null");
  }
  if (contains(c->name())) {
    throw util::invalid_argument(
        "checker", fmt::format("duplicate name {}", c->name()));
  }
  _checkers.emplace_back(std::move(c));
  return *this;
}

registry& registry::add(std::string name, function_checker::func_t func) {
  return add(
      std::make_unique<function_checker>(std::move(name), std::move(func)));
}

bool registry::contains(std::string_view name) const {
  for (const auto& c : _checkers) {
    if (c->name() == name) {
      return true;
    }
  }
  return false;
}

}  // namespace vigil::collector
