//
// Created by jason on 2022/10/11.
//

#include "status.hh"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cassert>

namespace vigil::protocol {

std::string_view name(enum member_status status) {
  static std::string_view types[] = {
      "none",
      "alive",
      "leaving",
      "left",
      "failed",
  };
  static_assert(
      sizeof(types) / sizeof(types[0]) ==
      static_cast<int>(member_status::num_of_status));
  assert(
      static_cast<uint8_t>(status) <
      static_cast<uint8_t>(member_status::num_of_status));
  return types[static_cast<uint8_t>(status)];
}

std::string_view name(enum status_type type) {
  static std::string_view types[] = {
      "running",
      "degraded",
      "unknown",
  };
  static_assert(
      sizeof(types) / sizeof(types[0]) ==
      static_cast<int>(status_type::num_of_type));
  assert(
      static_cast<uint8_t>(type) <
      static_cast<uint8_t>(status_type::num_of_type));
  return types[static_cast<uint8_t>(type)];
}

namespace {

bool has_tag(const tag_map& tags, std::string_view key, std::string_view v) {
  auto it = tags.find(std::string(key));
  return it != tags.end() && it->second == v;
}

}  // namespace

bool cluster_member::is_master() const {
  return has_tag(tags, role_tag, role_master);
}

bool cluster_member::is_leader() const {
  return has_tag(tags, leader_tag, leader_value);
}

std::string cluster_member::endpoint() const {
  return fmt::format("{}:{}", address, gossip_port);
}

std::ostream& operator<<(std::ostream& os, const cluster_member& m) {
  return os << fmt::format(
             "member[name:{}, addr:{}, status:{}, tags:{}]",
             m.name,
             m.endpoint(),
             m.status,
             m.tags);
}

probe_result probe_result::success(std::string node, std::string checker) {
  return probe_result{
      .node = std::move(node),
      .checker = std::move(checker),
      .succeeded = true};
}

probe_result probe_result::failure(
    std::string node, std::string checker, std::string detail) {
  return probe_result{
      .node = std::move(node),
      .checker = std::move(checker),
      .succeeded = false,
      .detail = std::move(detail)};
}

std::ostream& operator<<(std::ostream& os, const probe_result& p) {
  os << "probe[" << p.node << "/" << p.checker << ", "
     << (p.succeeded ? "ok" : "failed");
  if (!p.detail.empty()) {
    os << ", " << p.detail;
  }
  return os << "]";
}

const probe_result* node_status::find_probe(std::string_view checker) const {
  auto it = std::find_if(probes.begin(), probes.end(), [&](const auto& p) {
    return p.checker == checker;
  });
  return it == probes.end() ? nullptr : &*it;
}

std::ostream& operator<<(std::ostream& os, const node_status& s) {
  os << "node[" << s.name << ", " << s.status << ", " << s.member.status;
  for (const auto& p : s.probes) {
    if (!p.succeeded) {
      os << ", " << p;
    }
  }
  return os << "]";
}

node_status unknown_node_status(const cluster_member& member) {
  return node_status{
      .name = member.name, .member = member, .status = status_type::unknown};
}

status_type status_from_probes(const std::vector<probe_result>& probes) {
  for (const auto& p : probes) {
    if (!p.succeeded) {
      return status_type::degraded;
    }
  }
  return status_type::running;
}

const node_status* system_status::find_node(std::string_view name) const {
  auto it = std::find_if(nodes.begin(), nodes.end(), [&](const auto& n) {
    return n.name == name;
  });
  return it == nodes.end() ? nullptr : &*it;
}

std::string system_status::leader() const {
  for (const auto& n : nodes) {
    if (n.member.is_leader()) {
      return n.name;
    }
  }
  return {};
}

system_status system_status::empty() {
  return system_status{.status = status_type::unknown};
}

std::ostream& operator<<(std::ostream& os, const system_status& s) {
  os << "system[" << s.status;
  if (!s.summary.empty()) {
    os << ", " << s.summary;
  }
  os << ", nodes:" << s.nodes.size();
  for (const auto& n : s.nodes) {
    os << ", " << n;
  }
  return os << "]";
}

}  // namespace vigil::protocol
