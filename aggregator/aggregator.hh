//
// Created by jason on 2022/10/14.
//

#pragma once

#include <string>
#include <vector>

#include "protocol/status.hh"

namespace vigil::aggregator {

inline constexpr std::string_view master_unavailable =
    "master node unavailable";

// Reduces the statuses of all nodes into the status of the whole
// cluster. Pure, no I/O, the same inputs always give the same output.
//
// The cluster is running only if every node is running, some node is
// tagged as master, and every alive member reported a status. An
// unknown node degrades the cluster like a degraded one does. The only
// unknown outcome is having no node status at all.
//
// When several conditions hold, the summary reports the most important
// one, in this order:
//   1. master node unavailable
//   2. no status received from nodes (<missing>,)
//   3. the first failed, degraded or unknown node
protocol::system_status aggregate(
    const protocol::node_status& local,
    const std::vector<protocol::node_status>& remotes,
    const std::vector<protocol::cluster_member>& members,
    protocol::timestamp now);

// nodes are deduplicated by name, the first one wins
protocol::system_status aggregate(
    std::vector<protocol::node_status> nodes,
    const std::vector<protocol::cluster_member>& members,
    protocol::timestamp now);

// names of members without a node status, sorted
std::vector<std::string> missing_nodes(
    const std::vector<protocol::node_status>& nodes,
    const std::vector<protocol::cluster_member>& members);

std::string missing_summary(const std::vector<std::string>& missing);

}  // namespace vigil::aggregator
