//
// Created by jason on 2022/10/15.
//

#include "diff.hh"

#include <map>

namespace vigil::timeline {

namespace {

using protocol::node_status;

void diff_probes(
    const node_status& prev,
    const node_status& next,
    protocol::timestamp now,
    std::vector<event>& out) {
  for (const auto& probe : next.probes) {
    const auto* old = prev.find_probe(probe.checker);
    if (old == nullptr) {
      // a probe we have never seen is only worth reporting if it fails
      if (!probe.succeeded) {
        out.push_back({now, probe_failed{next.name, probe.checker}});
      }
      continue;
    }
    if (old->succeeded && !probe.succeeded) {
      out.push_back({now, probe_failed{next.name, probe.checker}});
    } else if (!old->succeeded && probe.succeeded) {
      out.push_back({now, probe_succeeded{next.name, probe.checker}});
    }
  }
}

void diff_node(
    const node_status& prev,
    const node_status& next,
    protocol::timestamp now,
    std::vector<event>& out) {
  if (prev.running() && !next.running()) {
    out.push_back({now, node_degraded{next.name}});
  } else if (!prev.running() && next.running()) {
    out.push_back({now, node_recovered{next.name}});
  }
  diff_probes(prev, next, now, out);
}

}  // namespace

std::vector<event> diff(
    const std::optional<protocol::system_status>& prev,
    const protocol::system_status& next,
    protocol::timestamp now) {
  std::vector<event> out;
  if (!prev) {
    return out;
  }
  if (prev->running() && !next.running()) {
    out.push_back({now, cluster_degraded{}});
  } else if (!prev->running() && next.running()) {
    out.push_back({now, cluster_recovered{}});
  }

  auto prev_leader = prev->leader();
  auto next_leader = next.leader();
  if (!next_leader.empty() && next_leader != prev_leader) {
    out.push_back(
        {now, leader_elected{std::move(prev_leader), std::move(next_leader)}});
  }

  std::map<std::string_view, std::pair<const node_status*, const node_status*>>
      nodes;
  for (const auto& n : prev->nodes) {
    nodes[n.name].first = &n;
  }
  for (const auto& n : next.nodes) {
    nodes[n.name].second = &n;
  }
  for (const auto& [name, pair] : nodes) {
    auto [before, after] = pair;
    if (before == nullptr) {
      out.push_back({now, node_added{std::string(name)}});
    } else if (after == nullptr) {
      out.push_back({now, node_removed{std::string(name)}});
    } else {
      diff_node(*before, *after, now, out);
    }
  }
  return out;
}

}  // namespace vigil::timeline
