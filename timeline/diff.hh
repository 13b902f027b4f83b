//
// Created by jason on 2022/10/15.
//

#pragma once

#include <optional>
#include <vector>

#include "timeline/event.hh"

namespace vigil::timeline {

// Transitions between two consecutive cluster statuses, all stamped with
// now. Without a previous status nothing is emitted, the next status is
// only a baseline.
//
// Order: the cluster event first, then a leader change, then per node
// sorted by name: added or removed, degraded or recovered, then probes in
// the node's probe order.
std::vector<event> diff(
    const std::optional<protocol::system_status>& prev,
    const protocol::system_status& next,
    protocol::timestamp now);

}  // namespace vigil::timeline
