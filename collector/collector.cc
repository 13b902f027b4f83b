//
// Created by jason on 2022/10/13.
//

#include "collector.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/future-util.hh>
#include <seastar/util/defer.hh>
#include <seastar/core/when_all.hh>
#include <seastar/core/with_timeout.hh>

#include "collector/logger.hh"
#include "util/error.hh"

namespace vigil::collector {

seastar::logger l{"collector"};

collector::collector(
    const registry& checkers,
    seastar::lowres_clock::duration probe_timeout,
    size_t max_concurrent_checkers)
  : _registry(checkers)
  , _probe_timeout(probe_timeout)
  , _inflight(seastar::make_lw_shared<inflight>(max_concurrent_checkers)) {
  if (max_concurrent_checkers == 0) {
    throw util::invalid_argument("max_concurrent_checkers", "must be positive");
  }
}

deadline_t collector::probe_deadline(
    deadline_t now, deadline_t deadline) const {
  if (deadline <= now) {
    return now;
  }
  auto inner = now + (deadline - now) * 3 / 4;
  return std::min(now + _probe_timeout, inner);
}

future<protocol::node_status> collector::collect(
    protocol::cluster_member self, deadline_t deadline) {
  if (_gate.is_closed()) [[unlikely]] {
    co_return coroutine::exception(
        std::make_exception_ptr(util::closed_error("collector")));
  }
  _gate.enter();
  auto leave = seastar::defer([this]() noexcept { _gate.leave(); });
  auto sub = probe_deadline(seastar::lowres_clock::now(), deadline);
  std::vector<future<protocol::probe_result>> running;
  running.reserve(_registry.size());
  for (const auto& c : _registry.checkers()) {
    running.emplace_back(probe(*c, self, sub));
  }
  auto probes = co_await seastar::when_all_succeed(
      running.begin(), running.end());
  protocol::node_status status{
      .name = self.name,
      .member = std::move(self),
      .status = protocol::status_from_probes(probes),
      .probes = std::move(probes)};
  l.debug("collector::collect: {}", status);
  _last = status;
  co_return status;
}

future<protocol::probe_result> collector::probe(
    checker& c, protocol::cluster_member self, deadline_t deadline) {
  auto node = self.name;
  auto name = c.name();
  std::string detail;
  try {
    auto units = co_await seastar::get_units(_inflight->slots, 1, deadline);
    if (_inflight->running.contains(name)) {
      // one copy per checker, the previous run still holds its own slot
      throw seastar::timed_out_error();
    }
    _inflight->running.insert(name);
    // the slot is released only once the checker returns, giving up on the
    // result leaves both the run and its slot behind
    auto run = seastar::futurize_invoke(
        [&c, self = std::move(self), deadline]() mutable {
          return c.run(std::move(self), deadline);
        }).finally(
        [inflight = _inflight, name, units = std::move(units)]() mutable {
          units.return_all();
          inflight->running.erase(name);
        });
    auto result = co_await seastar::with_timeout(deadline, std::move(run));
    result.node = std::move(node);
    result.checker = std::move(name);
    co_return result;
  } catch (const seastar::timed_out_error&) {
    detail = "timed out";
  } catch (const std::exception& ex) {
    detail = fmt::format("checker panicked: {}", ex.what());
  } catch (...) {
    detail = "checker panicked: unknown error";
  }
  l.warn("collector::probe: {} on {} failed: {}", name, node, detail);
  co_return protocol::probe_result::failure(
      std::move(node), std::move(name), std::move(detail));
}

future<> collector::close() {
  _inflight->slots.broken();
  return _gate.close();
}

}  // namespace vigil::collector
