//
// Created by jason on 2022/10/15.
//

#include "event.hh"

namespace vigil::timeline {

namespace {

template <typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::string_view event_type(const event_kind& kind) {
  return std::visit(
      overloaded{
          [](const cluster_degraded&) { return "cluster_degraded"; },
          [](const cluster_recovered&) { return "cluster_recovered"; },
          [](const node_added&) { return "node_added"; },
          [](const node_removed&) { return "node_removed"; },
          [](const node_degraded&) { return "node_degraded"; },
          [](const node_recovered&) { return "node_recovered"; },
          [](const probe_failed&) { return "probe_failed"; },
          [](const probe_succeeded&) { return "probe_succeeded"; },
          [](const leader_elected&) { return "leader_elected"; },
      },
      kind);
}

std::string_view event_node(const event_kind& kind) {
  return std::visit(
      overloaded{
          [](const cluster_degraded&) { return std::string_view{}; },
          [](const cluster_recovered&) { return std::string_view{}; },
          [](const auto& e) { return std::string_view{e.node}; },
      },
      kind);
}

int64_t event::unix_nano() const {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             time.time_since_epoch())
      .count();
}

std::ostream& operator<<(std::ostream& os, const event& e) {
  os << "event[" << e.type() << ", time:" << e.unix_nano();
  std::visit(
      overloaded{
          [&os](const probe_failed& p) {
            os << ", node:" << p.node << ", probe:" << p.probe;
          },
          [&os](const probe_succeeded& p) {
            os << ", node:" << p.node << ", probe:" << p.probe;
          },
          [&os](const leader_elected& p) {
            os << ", prev:" << p.prev << ", node:" << p.node;
          },
          [&os, &e](const auto&) {
            if (!e.node().empty()) {
              os << ", node:" << e.node();
            }
          },
      },
      e.kind);
  return os << "]";
}

}  // namespace vigil::timeline
