//
// Created by jason on 2022/10/17.
//

#include "agent.hh"

#include <fmt/ranges.h>

#include <cassert>
#include <seastar/core/coroutine.hh>
#include <seastar/core/when_all.hh>
#include <seastar/core/with_timeout.hh>
#include <seastar/util/defer.hh>

#include "aggregator/aggregator.hh"
#include "util/error.hh"
#include "vigil/logger.hh"

namespace vigil {

using namespace protocol;
using seastar::lowres_clock;

seastar::logger l{"vigil"};

std::string_view name(enum agent::state s) {
  static std::string_view types[] = {
      "initializing",
      "collecting",
      "idle",
      "stopped",
  };
  static_assert(
      sizeof(types) / sizeof(types[0]) ==
      static_cast<int>(agent::state::num_of_state));
  assert(
      static_cast<uint8_t>(s) <
      static_cast<uint8_t>(agent::state::num_of_state));
  return types[static_cast<uint8_t>(s)];
}

agent::agent(
    struct config cfg,
    membership::client& members,
    const collector::registry& checkers,
    transport::status_client& peers,
    timeline::execer* storage)
  : _config(std::move(cfg))
  , _timeouts(_config.derived_timeouts())
  , _members(members)
  , _peers(peers)
  , _collector(checkers, _timeouts.probe, _config.max_concurrent_checkers)
  , _timeline(storage, _config.history_capacity) {
  _timeouts.validate();
  _ticker.set_callback([this] { refresh(); });
}

future<> agent::start() {
  l.info("agent:{} starting, {}", _config.name, _timeouts);
  _state = state::initializing;
  try {
    auto tags = _config.tags;
    tags[std::string(rpc_port_tag)] = std::to_string(_config.rpc_port);
    co_await _members.update_tags(std::move(tags), {});
    if (!_config.peers.empty()) {
      try {
        co_await _members.join(_config.peers, false);
      } catch (const util::closed_error&) {
        throw;
      } catch (const std::exception& ex) {
        // a node started before its peers still has to come up
        l.warn("agent:{} failed to join {}: {}",
               _config.name,
               fmt::join(_config.peers, ","),
               ex.what());
      }
    }
    co_await _members.wait_ready(
        lowres_clock::now() +
        std::chrono::milliseconds(_config.initialization_timeout_ms));
  } catch (const std::exception& ex) {
    l.error("agent:{} failed to initialize: {}", _config.name, ex.what());
    _state = state::stopped;
    throw;
  }
  _state = state::idle;
  _ticker.arm_periodic(_timeouts.period);
  // no need to wait a whole period for the first status
  refresh();
  l.info("agent:{} started", _config.name);
}

future<> agent::stop() {
  if (_state == state::stopped && _gate.is_closed()) {
    co_return;
  }
  l.info("agent:{} stopping...", _config.name);
  _state = state::stopped;
  _ticker.cancel();
  co_await _gate.close();
  co_await _collector.close();
  l.info("agent:{} stopped", _config.name);
}

void agent::refresh() {
  if (_state == state::stopped || _gate.is_closed()) [[unlikely]] {
    return;
  }
  if (_cycle.available_units() <= 0) {
    l.debug("agent:{} skipped a tick, last cycle still running", _config.name);
    return;
  }
  (void)with_gate(_gate, [this] {
    return update_status().handle_exception([this](std::exception_ptr ex) {
      l.warn("agent:{} status cycle failed: {}", _config.name, ex);
    });
  });
}

future<> agent::update_status() {
  if (_state == state::stopped) [[unlikely]] {
    co_await coroutine::return_exception(util::closed_error("agent"));
  }
  auto units = co_await get_units(_cycle, 1);
  _state = state::collecting;
  auto back_to_idle = defer([this]() noexcept {
    if (_state == state::collecting) {
      _state = state::idle;
    }
  });
  auto start = lowres_clock::now();
  auto deadline = start + _timeouts.reply;

  auto members = co_await _members.members();
  auto self = self_from(members);

  auto local = _collector.collect(self, start + _timeouts.local);
  std::vector<future<std::optional<node_status>>> queries;
  for (const auto& m : members) {
    if (m.name != self.name) {
      queries.emplace_back(query(m, deadline));
    }
  }
  auto local_status = co_await std::move(local);
  record_last_seen(self.name, protocol::clock::now());
  auto answers = co_await when_all_succeed(queries.begin(), queries.end());
  std::vector<node_status> remotes;
  remotes.reserve(answers.size());
  for (auto& answer : answers) {
    if (answer) {
      remotes.emplace_back(std::move(*answer));
    }
  }

  auto status = aggregator::aggregate(
      local_status, remotes, members, protocol::clock::now());
  l.debug("agent:{} cycle took {}ms: {}",
          _config.name,
          std::chrono::duration_cast<std::chrono::milliseconds>(
              lowres_clock::now() - start)
              .count(),
          status);
  _status = status;
  co_await record(std::move(status));
}

future<> agent::record(system_status status) {
  auto now = status.time;
  try {
    co_await _timeline.step(std::move(status), now);
  } catch (const std::exception& ex) {
    // the published status stays authoritative
    l.warn("agent:{} timeline not recorded: {}", _config.name, ex.what());
  }
}

future<std::optional<node_status>> agent::query(
    cluster_member member, lowres_clock::time_point deadline) {
  try {
    auto status = co_await seastar::with_timeout(
        deadline, _peers.local_status(member, deadline));
    record_last_seen(member.name, protocol::clock::now());
    // the member is reported as this agent sees it, completed by the tags
    // the peer knows about itself
    auto reported = std::move(status.member.tags);
    status.name = member.name;
    status.member = std::move(member);
    status.member.tags.insert(reported.begin(), reported.end());
    co_return std::move(status);
  } catch (const util::timed_out_error& ex) {
    l.warn(
        "agent:{} no reply from {}: {}", _config.name, member.name, ex.what());
  } catch (const seastar::timed_out_error&) {
    l.warn("agent:{} no reply from {}", _config.name, member.name);
  } catch (const std::exception& ex) {
    l.warn("agent:{} failed to query {}: {}",
           _config.name,
           member.name,
           ex.what());
    co_return unknown_node_status(member);
  }
  co_return std::nullopt;
}

cluster_member agent::self_from(
    const std::vector<cluster_member>& members) const {
  for (const auto& m : members) {
    if (m.name == _config.name) {
      return m;
    }
  }
  // the substrate does not list us (yet), use what we would gossip
  cluster_member self{
      .name = _config.name,
      .address = _config.address,
      .gossip_port = _config.gossip_port,
      .tags = _config.tags,
      .status = member_status::alive};
  return self;
}

system_status agent::status() const {
  if (!_status) {
    throw util::no_data_error("no status collected yet");
  }
  return *_status;
}

future<node_status> agent::local_status() const {
  const auto& last = _collector.last_status();
  if (!last) {
    return make_exception_future<node_status>(
        util::no_data_error("no local status collected yet"));
  }
  return make_ready_future<node_status>(*last);
}

timestamp agent::last_seen(std::string_view name) const {
  auto it = _last_seen.find(name);
  if (it == _last_seen.end()) {
    throw util::member_not_found_error(name);
  }
  return it->second;
}

void agent::record_last_seen(std::string name, timestamp at) {
  auto [it, inserted] = _last_seen.try_emplace(std::move(name), at);
  if (!inserted && it->second < at) {
    it->second = at;
  }
}

std::vector<timeline::event> agent::history() const {
  return _timeline.history();
}

future<std::vector<cluster_member>> agent::members() {
  return _members.members();
}

future<size_t> agent::join(std::vector<std::string> peers) {
  return _members.join(std::move(peers), false);
}

future<bool> agent::is_member() {
  return _members.is_member(_config.name);
}

}  // namespace vigil
