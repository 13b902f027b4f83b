//
// Created by jason on 2022/10/11.
//

#pragma once

#include <fmt/ostream.h>
#include <stdint.h>

#include <chrono>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::protocol {

using clock = std::chrono::system_clock;
using timestamp = clock::time_point;

// tags every agent understands
inline constexpr std::string_view role_tag = "role";
inline constexpr std::string_view role_master = "master";
inline constexpr std::string_view role_node = "node";
inline constexpr std::string_view leader_tag = "leader";
inline constexpr std::string_view leader_value = "true";
// port of the agent's status rpc, pushed by every agent on start
inline constexpr std::string_view rpc_port_tag = "rpc_port";

using tag_map = std::map<std::string, std::string>;

// gossip status of a member as reported by the substrate
enum class member_status : uint8_t {
  none,
  alive,
  leaving,
  left,
  failed,
  num_of_status,
};

std::string_view name(enum member_status status);
inline std::ostream& operator<<(std::ostream& os, member_status status) {
  return os << name(status);
}

enum class status_type : uint8_t {
  running,
  degraded,
  unknown,
  num_of_type,
};

std::string_view name(enum status_type type);
inline std::ostream& operator<<(std::ostream& os, status_type type) {
  return os << name(type);
}

struct cluster_member {
  std::string name;
  std::string address;
  uint16_t gossip_port = 0;
  tag_map tags;
  member_status status = member_status::none;

  bool is_alive() const noexcept { return status == member_status::alive; }
  bool is_master() const;
  bool is_leader() const;
  std::string endpoint() const;

  bool operator==(const cluster_member&) const = default;

  friend std::ostream& operator<<(std::ostream& os, const cluster_member& m);
};

// network coordinate estimated by the substrate, opaque to the agent
struct coordinate {
  std::vector<double> vec;
  double error = 0;
  double adjustment = 0;
  double height = 0;
};

struct probe_result {
  std::string node;
  std::string checker;
  bool succeeded = false;
  std::string detail;

  static probe_result success(std::string node, std::string checker);
  static probe_result failure(
      std::string node, std::string checker, std::string detail);

  bool operator==(const probe_result&) const = default;

  friend std::ostream& operator<<(std::ostream& os, const probe_result& p);
};

struct node_status {
  std::string name;
  cluster_member member;
  status_type status = status_type::unknown;
  std::vector<probe_result> probes;

  bool running() const noexcept { return status == status_type::running; }
  // nullptr if the node did not report the named probe
  const probe_result* find_probe(std::string_view checker) const;

  bool operator==(const node_status&) const = default;

  friend std::ostream& operator<<(std::ostream& os, const node_status& s);
};

// status of a member whose report could not be obtained
node_status unknown_node_status(const cluster_member& member);
// degraded iff any probe failed
status_type status_from_probes(const std::vector<probe_result>& probes);

struct system_status {
  status_type status = status_type::unknown;
  std::string summary;
  timestamp time;
  std::vector<node_status> nodes;

  bool running() const noexcept { return status == status_type::running; }
  const node_status* find_node(std::string_view name) const;
  // name of the member tagged as leader, empty if none
  std::string leader() const;

  static system_status empty();

  bool operator==(const system_status&) const = default;

  friend std::ostream& operator<<(std::ostream& os, const system_status& s);
};

}  // namespace vigil::protocol

template <>
struct fmt::formatter<vigil::protocol::member_status>
  : fmt::ostream_formatter {};
template <>
struct fmt::formatter<vigil::protocol::status_type> : fmt::ostream_formatter {};
template <>
struct fmt::formatter<vigil::protocol::cluster_member>
  : fmt::ostream_formatter {};
template <>
struct fmt::formatter<vigil::protocol::probe_result>
  : fmt::ostream_formatter {};
template <>
struct fmt::formatter<vigil::protocol::node_status> : fmt::ostream_formatter {};
template <>
struct fmt::formatter<vigil::protocol::system_status>
  : fmt::ostream_formatter {};
