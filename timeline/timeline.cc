//
// Created by jason on 2022/10/15.
//

#include "timeline.hh"

#include <seastar/core/coroutine.hh>

#include "timeline/logger.hh"
#include "util/error.hh"

namespace vigil::timeline {

seastar::logger l{"timeline"};

statement to_statement(const event& e) {
  statement s;
  s.args.emplace_back(e.unix_nano());
  s.args.emplace_back(std::string(e.type()));
  const auto* leader = std::get_if<leader_elected>(&e.kind);
  const auto* failed = std::get_if<probe_failed>(&e.kind);
  const auto* succeeded = std::get_if<probe_succeeded>(&e.kind);
  if (leader != nullptr) {
    s.stmt =
        "INSERT INTO events (timestamp, type, oldState, newState) "
        "VALUES (?, ?, ?, ?)";
    s.args.emplace_back(leader->prev);
    s.args.emplace_back(leader->node);
  } else if (failed != nullptr || succeeded != nullptr) {
    s.stmt =
        "INSERT INTO events (timestamp, type, node, probe) VALUES (?, ?, ?, ?)";
    s.args.emplace_back(failed ? failed->node : succeeded->node);
    s.args.emplace_back(failed ? failed->probe : succeeded->probe);
  } else if (e.node().empty()) {
    s.stmt = "INSERT INTO events (timestamp, type) VALUES (?, ?)";
  } else {
    s.stmt = "INSERT INTO events (timestamp, type, node) VALUES (?, ?, ?)";
    s.args.emplace_back(std::string(e.node()));
  }
  return s;
}

future<> record(const event& e, execer& storage) {
  auto s = to_statement(e);
  return storage.exec(std::move(s.stmt), std::move(s.args));
}

timeline::timeline(execer* storage, size_t history_capacity)
  : _storage(storage), _history_capacity(history_capacity) {}

future<std::vector<event>> timeline::step(
    protocol::system_status next, protocol::timestamp now) {
  auto units = co_await seastar::get_units(_serializer, 1);
  auto events = diff(_baseline, next, now);
  _baseline = std::move(next);
  remember(events);
  if (_storage == nullptr || events.empty()) {
    co_return events;
  }
  size_t failed = 0;
  std::string first_error;
  for (const auto& e : events) {
    try {
      co_await record(e, *_storage);
    } catch (const std::exception& ex) {
      if (failed++ == 0) {
        first_error = ex.what();
      }
      l.warn("timeline::step: failed to record {}: {}", e, ex.what());
    }
  }
  if (failed > 0) {
    co_return coroutine::exception(std::make_exception_ptr(
        util::storage_error(fmt::format(
            "{} of {} events not recorded, first error: {}",
            failed,
            events.size(),
            first_error))));
  }
  co_return events;
}

std::vector<event> timeline::history() const {
  return {_history.begin(), _history.end()};
}

void timeline::remember(const std::vector<event>& events) {
  for (const auto& e : events) {
    l.info("timeline: {}", e);
    _history.push_back(e);
  }
  while (_history.size() > _history_capacity) {
    _history.pop_front();
  }
}

}  // namespace vigil::timeline
