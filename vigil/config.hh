//
// Created by jason on 2022/10/17.
//

#pragma once

#include <stdint.h>

#include <chrono>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace vigil {

// The nested deadlines of one status cycle. Each one bounds the work
// awaited by the one before it:
//   period > reply > local > probe
struct timeouts {
  // interval between two status cycles
  std::chrono::milliseconds period{0};
  // how long a cycle waits for peers to answer
  std::chrono::milliseconds reply{0};
  // how long the local collection may take
  std::chrono::milliseconds local{0};
  // how long a single checker may take
  std::chrono::milliseconds probe{0};

  // every inner timeout is three quarters of its parent
  static timeouts derive(std::chrono::milliseconds period);

  void validate() const;

  bool operator==(const timeouts&) const = default;
  friend std::ostream& operator<<(std::ostream& os, const timeouts& t);
};

struct config {
  // the name of this agent and of its member, unique in the cluster
  std::string name;

  // the gossip address and port of this member
  std::string address = "127.0.0.1";
  uint16_t gossip_port = 7946;

  // the listening address and port for peers' status queries
  std::string rpc_address = "0.0.0.0";
  uint16_t rpc_port = 7575;

  // the listening address and port of the health endpoint
  std::string api_address = "0.0.0.0";
  uint16_t api_port = 7580;

  // tags pushed to the membership on start, e.g. role: master
  std::map<std::string, std::string> tags;

  // peers to join on start, name@host:port
  std::vector<std::string> peers;

  uint64_t status_update_period_ms = 30000;

  // 0 means derived from status_update_period_ms
  uint64_t reply_timeout_ms = 0;
  uint64_t local_status_timeout_ms = 0;
  uint64_t probe_timeout_ms = 0;

  // how long the agent waits for the membership to become usable
  uint64_t initialization_timeout_ms = 30000;

  uint64_t max_concurrent_checkers = 10;

  // the number of recent timeline events kept in memory
  uint64_t history_capacity = 256;

  // where the timeline journal is written, disabled if empty
  std::string timeline_dir;

  // derived timeouts with explicit overrides applied
  timeouts derived_timeouts() const;

  void validate() const;

  static config read_from(std::istream& input);
  void write_to(std::ostream& output) const;

  friend std::ostream& operator<<(std::ostream& os, const config& cfg);
};

}  // namespace vigil
