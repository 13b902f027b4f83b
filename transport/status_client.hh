//
// Created by jason on 2022/10/16.
//

#pragma once

#include <functional>
#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>

#include "protocol/status.hh"
#include "util/seastarx.hh"

namespace vigil::transport {

// Asks a peer agent for the status of its own node. A peer that does not
// answer before the deadline fails with util::timed_out_error, any other
// failure is the peer's or the network's.
class status_client {
 public:
  virtual ~status_client() = default;

  virtual future<protocol::node_status> local_status(
      protocol::cluster_member member,
      seastar::lowres_clock::time_point deadline) = 0;

  using local_status_handler = std::function<future<protocol::node_status>()>;
  // answers the peers' queries
  virtual void register_local_status_handler(local_status_handler&& func) = 0;
};

}  // namespace vigil::transport
