//
// Created by jason on 2021/12/11.
//

#pragma once

#include <map>
#include <memory>
#include <set>

#include "protocol/status.hh"
#include "timeline/execer.hh"
#include "transport/status_client.hh"
#include "vigil/config.hh"

namespace vigil::test {

class util {
 public:
  // an alive member tagged with the given role
  static protocol::cluster_member member(
      std::string name, std::string_view role = protocol::role_node);
  static protocol::cluster_member master(std::string name);
  // a node with one probe per entry, true for a succeeded probe
  static protocol::node_status node(
      const protocol::cluster_member& m,
      std::vector<std::pair<std::string, bool>> probes = {});
  static protocol::system_status running(
      std::vector<protocol::node_status> nodes);
  static protocol::system_status degraded(
      std::vector<protocol::node_status> nodes);
  // a config with short timeouts for tests
  static config default_config(std::string name);
};

// keeps every statement, fails on demand
class memory_execer final : public timeline::execer {
 public:
  future<> exec(
      std::string stmt, std::vector<timeline::argument> args) override;

  struct statement {
    std::string stmt;
    std::vector<timeline::argument> args;
  };
  std::vector<statement> statements;
  bool fail = false;
};

// answers local_status from canned statuses
class fake_peers final : public transport::status_client {
 public:
  future<protocol::node_status> local_status(
      protocol::cluster_member member,
      seastar::lowres_clock::time_point deadline) override;
  void register_local_status_handler(local_status_handler&& func) override {
    handler = std::move(func);
  }

  std::map<std::string, protocol::node_status> statuses;
  // these peers time out
  std::set<std::string> silent;
  // these peers fail with an error
  std::set<std::string> broken;
  uint64_t queries = 0;
  local_status_handler handler;
};

}  // namespace vigil::test
