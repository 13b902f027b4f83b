//
// Created by jason on 2022/10/15.
//

#pragma once

#include <deque>
#include <optional>
#include <seastar/core/semaphore.hh>

#include "timeline/diff.hh"
#include "timeline/execer.hh"
#include "util/types.hh"

namespace vigil::timeline {

struct statement {
  std::string stmt;
  std::vector<argument> args;
};

// insert statement of the event, the timestamp is in nanoseconds
statement to_statement(const event& e);

future<> record(const event& e, execer& storage);

// Detects the transitions of every new cluster status and appends them
// to the storage. Steps never interleave, each one is diffed against the
// status of the step before it.
class timeline {
 public:
  // storage may be null, events are then only kept in the history
  timeline(execer* storage, size_t history_capacity);
  DISALLOW_COPY_MOVE_AND_ASSIGN(timeline);

  // Returns the emitted events. The new status becomes the baseline and
  // the events enter the history even if the storage rejects them, in
  // which case a storage_error is raised once every event was tried.
  future<std::vector<event>> step(
      protocol::system_status next, protocol::timestamp now);

  // oldest first
  std::vector<event> history() const;
  const std::optional<protocol::system_status>& baseline() const noexcept {
    return _baseline;
  }

 private:
  void remember(const std::vector<event>& events);

  execer* _storage;
  size_t _history_capacity;
  seastar::semaphore _serializer{1};
  std::optional<protocol::system_status> _baseline;
  std::deque<event> _history;
};

}  // namespace vigil::timeline
