//
// Created by jason on 2021/12/11.
//

#include "util.hh"

#include "util/error.hh"

namespace vigil::test {

using namespace protocol;

cluster_member util::member(std::string name, std::string_view role) {
  cluster_member m;
  m.name = std::move(name);
  m.address = "127.0.0.1";
  m.gossip_port = 7946;
  m.tags[std::string(role_tag)] = std::string(role);
  m.status = member_status::alive;
  return m;
}

cluster_member util::master(std::string name) {
  return member(std::move(name), role_master);
}

node_status util::node(
    const cluster_member& m, std::vector<std::pair<std::string, bool>> probes) {
  node_status n;
  n.name = m.name;
  n.member = m;
  for (auto& [checker, ok] : probes) {
    n.probes.push_back(
        ok ? probe_result::success(m.name, checker)
           : probe_result::failure(m.name, checker, "failed"));
  }
  n.status = status_from_probes(n.probes);
  return n;
}

system_status util::running(std::vector<node_status> nodes) {
  return system_status{
      .status = status_type::running,
      .time = clock::now(),
      .nodes = std::move(nodes)};
}

system_status util::degraded(std::vector<node_status> nodes) {
  return system_status{
      .status = status_type::degraded,
      .summary = "degraded",
      .time = clock::now(),
      .nodes = std::move(nodes)};
}

config util::default_config(std::string name) {
  config cfg;
  cfg.name = std::move(name);
  cfg.status_update_period_ms = 400;
  cfg.initialization_timeout_ms = 1000;
  cfg.history_capacity = 16;
  return cfg;
}

future<> memory_execer::exec(
    std::string stmt, std::vector<timeline::argument> args) {
  if (fail) {
    return make_exception_future<>(vigil::util::storage_error("injected"));
  }
  statements.push_back({std::move(stmt), std::move(args)});
  return make_ready_future<>();
}

future<node_status> fake_peers::local_status(
    cluster_member member, seastar::lowres_clock::time_point deadline) {
  ++queries;
  if (silent.contains(member.name)) {
    return make_exception_future<node_status>(
        vigil::util::timed_out_error(member.name));
  }
  if (broken.contains(member.name)) {
    return make_exception_future<node_status>(
        std::runtime_error("connection refused"));
  }
  auto it = statuses.find(member.name);
  if (it == statuses.end()) {
    return make_exception_future<node_status>(
        vigil::util::no_data_error(member.name));
  }
  return make_ready_future<node_status>(it->second);
}

}  // namespace vigil::test
