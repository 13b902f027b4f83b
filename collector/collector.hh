//
// Created by jason on 2022/10/13.
//

#pragma once

#include <optional>
#include <seastar/core/gate.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <unordered_set>

#include "collector/checker.hh"

namespace vigil::collector {

// Runs every registered checker against the local node and folds the
// probes into a node status. A misbehaving checker only ever costs its
// own probe.
class collector {
 public:
  using semaphore_t = seastar::basic_semaphore<
      seastar::semaphore_default_exception_factory,
      seastar::lowres_clock>;

  collector(
      const registry& checkers,
      seastar::lowres_clock::duration probe_timeout,
      size_t max_concurrent_checkers);
  DISALLOW_COPY_MOVE_AND_ASSIGN(collector);

  // never fails because of a checker, probes keep registration order
  future<protocol::node_status> collect(
      protocol::cluster_member self, deadline_t deadline);

  // the status produced by the latest collect(), if any
  const std::optional<protocol::node_status>& last_status() const noexcept {
    return _last;
  }

  // the deadline each checker gets out of the parent's deadline
  deadline_t probe_deadline(deadline_t now, deadline_t deadline) const;

  // number of checker runs that have not returned yet, including the
  // ones abandoned by a timed out probe
  size_t running() const noexcept { return _inflight->running.size(); }

  // waits for in-progress collect() calls, never for abandoned checkers
  future<> close();

 private:
  // shared with abandoned runs so they can release their slot after the
  // collector is gone
  struct inflight {
    explicit inflight(size_t slots) : slots(slots) {}
    semaphore_t slots;
    std::unordered_set<std::string> running;
  };

  future<protocol::probe_result> probe(
      checker& c, protocol::cluster_member self, deadline_t deadline);

  const registry& _registry;
  seastar::lowres_clock::duration _probe_timeout;
  seastar::lw_shared_ptr<inflight> _inflight;
  seastar::gate _gate;
  std::optional<protocol::node_status> _last;
};

}  // namespace vigil::collector
