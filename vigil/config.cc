//
// Created by jason on 2022/10/17.
//

#include "config.hh"

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "util/error.hh"

namespace YAML {

template <>
struct convert<vigil::config> {
  static Node encode(const vigil::config& cfg) {
    Node node;
    node["name"] = cfg.name;
    node["address"] = cfg.address;
    node["gossip_port"] = cfg.gossip_port;
    node["rpc_address"] = cfg.rpc_address;
    node["rpc_port"] = cfg.rpc_port;
    node["api_address"] = cfg.api_address;
    node["api_port"] = cfg.api_port;
    node["tags"] = cfg.tags;
    node["peers"] = cfg.peers;
    node["status_update_period_ms"] = cfg.status_update_period_ms;
    node["reply_timeout_ms"] = cfg.reply_timeout_ms;
    node["local_status_timeout_ms"] = cfg.local_status_timeout_ms;
    node["probe_timeout_ms"] = cfg.probe_timeout_ms;
    node["initialization_timeout_ms"] = cfg.initialization_timeout_ms;
    node["max_concurrent_checkers"] = cfg.max_concurrent_checkers;
    node["history_capacity"] = cfg.history_capacity;
    node["timeline_dir"] = cfg.timeline_dir;
    return node;
  }
  static bool decode(const Node& node, vigil::config& cfg) {
    if (!node.IsMap()) {
      return false;
    }
    if (node["name"]) {
      cfg.name = node["name"].as<std::string>();
    }
    if (node["address"]) {
      cfg.address = node["address"].as<std::string>();
    }
    if (node["gossip_port"]) {
      cfg.gossip_port = node["gossip_port"].as<uint16_t>();
    }
    if (node["rpc_address"]) {
      cfg.rpc_address = node["rpc_address"].as<std::string>();
    }
    if (node["rpc_port"]) {
      cfg.rpc_port = node["rpc_port"].as<uint16_t>();
    }
    if (node["api_address"]) {
      cfg.api_address = node["api_address"].as<std::string>();
    }
    if (node["api_port"]) {
      cfg.api_port = node["api_port"].as<uint16_t>();
    }
    if (node["tags"]) {
      cfg.tags = node["tags"].as<std::map<std::string, std::string>>();
    }
    if (node["peers"]) {
      cfg.peers = node["peers"].as<std::vector<std::string>>();
    }
    if (node["status_update_period_ms"]) {
      cfg.status_update_period_ms =
          node["status_update_period_ms"].as<uint64_t>();
    }
    if (node["reply_timeout_ms"]) {
      cfg.reply_timeout_ms = node["reply_timeout_ms"].as<uint64_t>();
    }
    if (node["local_status_timeout_ms"]) {
      cfg.local_status_timeout_ms =
          node["local_status_timeout_ms"].as<uint64_t>();
    }
    if (node["probe_timeout_ms"]) {
      cfg.probe_timeout_ms = node["probe_timeout_ms"].as<uint64_t>();
    }
    if (node["initialization_timeout_ms"]) {
      cfg.initialization_timeout_ms =
          node["initialization_timeout_ms"].as<uint64_t>();
    }
    if (node["max_concurrent_checkers"]) {
      cfg.max_concurrent_checkers =
          node["max_concurrent_checkers"].as<uint64_t>();
    }
    if (node["history_capacity"]) {
      cfg.history_capacity = node["history_capacity"].as<uint64_t>();
    }
    if (node["timeline_dir"]) {
      cfg.timeline_dir = node["timeline_dir"].as<std::string>();
    }
    return true;
  }
};

}  // namespace YAML

namespace vigil {

using std::chrono::milliseconds;

timeouts timeouts::derive(milliseconds period) {
  timeouts t;
  t.period = period;
  t.reply = period * 3 / 4;
  t.local = t.reply * 3 / 4;
  t.probe = t.local * 3 / 4;
  return t;
}

void timeouts::validate() const {
  if (probe.count() <= 0) {
    throw util::configuration_error("probe_timeout_ms", "must be positive");
  }
  if (local <= probe) {
    throw util::configuration_error(
        "local_status_timeout_ms", "must exceed probe_timeout_ms");
  }
  if (reply <= local) {
    throw util::configuration_error(
        "reply_timeout_ms", "must exceed local_status_timeout_ms");
  }
  if (period <= reply) {
    throw util::configuration_error(
        "status_update_period_ms", "must exceed reply_timeout_ms");
  }
}

std::ostream& operator<<(std::ostream& os, const timeouts& t) {
  return os << "period: " << t.period.count() << "ms, "
            << "reply: " << t.reply.count() << "ms, "
            << "local: " << t.local.count() << "ms, "
            << "probe: " << t.probe.count() << "ms";
}

timeouts config::derived_timeouts() const {
  auto t = timeouts::derive(milliseconds(status_update_period_ms));
  if (reply_timeout_ms > 0) {
    t.reply = milliseconds(reply_timeout_ms);
  }
  if (local_status_timeout_ms > 0) {
    t.local = milliseconds(local_status_timeout_ms);
  }
  if (probe_timeout_ms > 0) {
    t.probe = milliseconds(probe_timeout_ms);
  }
  return t;
}

void config::validate() const {
  if (name.empty()) {
    throw util::configuration_error("name", "empty");
  }
  if (address.empty()) {
    throw util::configuration_error("address", "empty");
  }
  if (gossip_port == 0) {
    throw util::configuration_error("gossip_port", "invalid");
  }
  if (rpc_port == 0) {
    throw util::configuration_error("rpc_port", "invalid");
  }
  if (api_port == 0) {
    throw util::configuration_error("api_port", "invalid");
  }
  if (status_update_period_ms == 0) {
    throw util::configuration_error("status_update_period_ms", "invalid");
  }
  derived_timeouts().validate();
  if (initialization_timeout_ms == 0) {
    throw util::configuration_error("initialization_timeout_ms", "invalid");
  }
  if (max_concurrent_checkers == 0) {
    throw util::configuration_error("max_concurrent_checkers", "invalid");
  }
  if (history_capacity == 0) {
    throw util::configuration_error("history_capacity", "invalid");
  }
}

config config::read_from(std::istream& input) {
  return YAML::Load(input).as<config>();
}

void config::write_to(std::ostream& output) const {
  YAML::Node node;
  node = *this;
  output << YAML::Dump(node);
}

std::ostream& operator<<(std::ostream& os, const config& cfg) {
  os << "name: " << cfg.name << ", "
     << "address: " << cfg.address << ":" << cfg.gossip_port << ", "
     << "rpc: " << cfg.rpc_address << ":" << cfg.rpc_port << ", "
     << "api: " << cfg.api_address << ":" << cfg.api_port << ", "
     << "tags: " << fmt::format("{}", fmt::join(cfg.tags, ",")) << ", "
     << "peers: " << fmt::format("{}", fmt::join(cfg.peers, ",")) << ", "
     << "timeouts: [" << cfg.derived_timeouts() << "], "
     << "initialization_timeout_ms: " << cfg.initialization_timeout_ms << ", "
     << "max_concurrent_checkers: " << cfg.max_concurrent_checkers << ", "
     << "history_capacity: " << cfg.history_capacity << ", "
     << "timeline_dir: " << cfg.timeline_dir;
  return os;
}

}  // namespace vigil
