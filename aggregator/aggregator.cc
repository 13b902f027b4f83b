//
// Created by jason on 2022/10/14.
//

#include "aggregator.hh"

#include <algorithm>
#include <set>

#include "aggregator/logger.hh"

namespace vigil::aggregator {

seastar::logger l{"aggregator"};

namespace {

std::string offender_summary(const protocol::node_status& node) {
  if (node.member.status == protocol::member_status::failed) {
    return fmt::format("node {} has failed", node.name);
  }
  if (node.status == protocol::status_type::unknown) {
    return fmt::format("node {} status is unknown", node.name);
  }
  return fmt::format("node {} is degraded", node.name);
}

bool healthy(const protocol::node_status& node) {
  return node.member.status != protocol::member_status::failed &&
         node.running();
}

}  // namespace

protocol::system_status aggregate(
    const protocol::node_status& local,
    const std::vector<protocol::node_status>& remotes,
    const std::vector<protocol::cluster_member>& members,
    protocol::timestamp now) {
  std::vector<protocol::node_status> nodes;
  nodes.reserve(remotes.size() + 1);
  nodes.push_back(local);
  nodes.insert(nodes.end(), remotes.begin(), remotes.end());
  return aggregate(std::move(nodes), members, now);
}

protocol::system_status aggregate(
    std::vector<protocol::node_status> nodes,
    const std::vector<protocol::cluster_member>& members,
    protocol::timestamp now) {
  std::set<std::string> seen;
  std::erase_if(nodes, [&seen](const protocol::node_status& n) {
    return !seen.insert(n.name).second;
  });

  auto missing = missing_nodes(nodes, members);
  if (nodes.empty()) {
    auto result = protocol::system_status::empty();
    result.time = now;
    result.summary = missing.empty() ? "no node status available"
                                     : missing_summary(missing);
    return result;
  }

  protocol::system_status result{
      .status = protocol::status_type::running, .time = now};
  for (const auto& node : nodes) {
    if (!healthy(node)) {
      result.status = protocol::status_type::degraded;
      result.summary = offender_summary(node);
      break;
    }
  }
  if (!missing.empty()) {
    result.status = protocol::status_type::degraded;
    result.summary = missing_summary(missing);
  }
  auto has_master = std::any_of(nodes.begin(), nodes.end(), [](const auto& n) {
    return n.member.is_master();
  });
  if (!has_master) {
    result.status = protocol::status_type::degraded;
    result.summary = std::string(master_unavailable);
  }
  result.nodes = std::move(nodes);
  l.trace("aggregate: {}", result);
  return result;
}

std::vector<std::string> missing_nodes(
    const std::vector<protocol::node_status>& nodes,
    const std::vector<protocol::cluster_member>& members) {
  std::vector<std::string> missing;
  for (const auto& m : members) {
    auto found = std::any_of(nodes.begin(), nodes.end(), [&m](const auto& n) {
      return n.name == m.name;
    });
    if (!found) {
      missing.push_back(m.name);
    }
  }
  std::sort(missing.begin(), missing.end());
  missing.erase(std::unique(missing.begin(), missing.end()), missing.end());
  return missing;
}

std::string missing_summary(const std::vector<std::string>& missing) {
  std::string names;
  for (const auto& name : missing) {
    names.append(name).push_back(',');
  }
  return fmt::format("no status received from nodes ({})", names);
}

}  // namespace vigil::aggregator
