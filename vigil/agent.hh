//
// Created by jason on 2022/10/17.
//

#pragma once

#include <map>
#include <optional>
#include <seastar/core/gate.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/timer.hh>

#include "collector/collector.hh"
#include "membership/client.hh"
#include "timeline/timeline.hh"
#include "transport/status_client.hh"
#include "util/types.hh"
#include "vigil/config.hh"

namespace vigil {

// The agent of one node. It periodically collects the local status,
// queries every peer, reduces everything into the cluster status and
// records the transitions. Queries only ever read the last published
// status and never wait for a cycle in flight.
class agent {
 public:
  enum class state : uint8_t {
    initializing,
    collecting,
    idle,
    stopped,
    num_of_state,
  };

  // storage may be null, the timeline then only keeps its history
  agent(
      struct config cfg,
      membership::client& members,
      const collector::registry& checkers,
      transport::status_client& peers,
      timeline::execer* storage);
  DISALLOW_COPY_MOVE_AND_ASSIGN(agent);

  // pushes tags, joins configured peers and waits for the membership,
  // failing here is fatal
  future<> start();
  // cancels the loop and waits for the cycle in flight
  future<> stop();

  // one status cycle, fails only if no member list can be obtained
  future<> update_status();
  // starts a cycle in the background unless one is already running
  void refresh();

  // the last published cluster status, throws no_data_error before the
  // first successful cycle
  protocol::system_status status() const;
  // the last status collected on this node, answered to peers
  future<protocol::node_status> local_status() const;
  // when this agent last heard from the member, throws
  // member_not_found_error for a member it never heard from
  protocol::timestamp last_seen(std::string_view name) const;
  // keeps the latest of the recorded timestamps
  void record_last_seen(std::string name, protocol::timestamp at);
  // recent timeline events, oldest first
  std::vector<timeline::event> history() const;
  future<std::vector<protocol::cluster_member>> members();
  future<size_t> join(std::vector<std::string> peers);
  future<bool> is_member();

  enum state current_state() const noexcept { return _state; }
  const struct config& cfg() const noexcept { return _config; }

 private:
  protocol::cluster_member self_from(
      const std::vector<protocol::cluster_member>& members) const;
  // nullopt if the peer did not answer in time
  future<std::optional<protocol::node_status>> query(
      protocol::cluster_member member,
      seastar::lowres_clock::time_point deadline);
  future<> record(protocol::system_status status);

  struct config _config;
  struct timeouts _timeouts;
  membership::client& _members;
  transport::status_client& _peers;
  collector::collector _collector;
  timeline::timeline _timeline;
  enum state _state = state::initializing;
  std::optional<protocol::system_status> _status;
  std::map<std::string, protocol::timestamp, std::less<>> _last_seen;
  // at most one cycle at a time
  seastar::semaphore _cycle{1};
  seastar::gate _gate;
  seastar::timer<seastar::lowres_clock> _ticker;
};

std::string_view name(enum agent::state s);

inline std::ostream& operator<<(std::ostream& os, enum agent::state s) {
  return os << name(s);
}

}  // namespace vigil

template <>
struct fmt::formatter<vigil::agent::state> : fmt::ostream_formatter {};
