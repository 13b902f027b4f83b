//
// Created by jason on 2022/10/15.
//

#pragma once

#include <ostream>
#include <string>
#include <variant>

#include "protocol/status.hh"

namespace vigil::timeline {

struct cluster_degraded {
  bool operator==(const cluster_degraded&) const = default;
};

struct cluster_recovered {
  bool operator==(const cluster_recovered&) const = default;
};

struct node_added {
  std::string node;
  bool operator==(const node_added&) const = default;
};

struct node_removed {
  std::string node;
  bool operator==(const node_removed&) const = default;
};

struct node_degraded {
  std::string node;
  bool operator==(const node_degraded&) const = default;
};

struct node_recovered {
  std::string node;
  bool operator==(const node_recovered&) const = default;
};

struct probe_failed {
  std::string node;
  std::string probe;
  bool operator==(const probe_failed&) const = default;
};

struct probe_succeeded {
  std::string node;
  std::string probe;
  bool operator==(const probe_succeeded&) const = default;
};

// prev is empty when there was no leader before
struct leader_elected {
  std::string prev;
  std::string node;
  bool operator==(const leader_elected&) const = default;
};

using event_kind = std::variant<
    cluster_degraded,
    cluster_recovered,
    node_added,
    node_removed,
    node_degraded,
    node_recovered,
    probe_failed,
    probe_succeeded,
    leader_elected>;

std::string_view event_type(const event_kind& kind);

// node the event is about, empty for cluster wide events
std::string_view event_node(const event_kind& kind);

struct event {
  protocol::timestamp time;
  event_kind kind;

  std::string_view type() const { return event_type(kind); }
  std::string_view node() const { return event_node(kind); }
  // nanoseconds since epoch
  int64_t unix_nano() const;

  template <typename T>
  bool is() const noexcept {
    return std::holds_alternative<T>(kind);
  }

  bool operator==(const event&) const = default;

  friend std::ostream& operator<<(std::ostream& os, const event& e);
};

}  // namespace vigil::timeline

template <>
struct fmt::formatter<vigil::timeline::event> : fmt::ostream_formatter {};
