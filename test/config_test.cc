//
// Created by jason on 2022/6/5.
//

#include "vigil/config.hh"

#include <functional>
#include <sstream>

#include "test/base.hh"
#include "util/error.hh"

namespace {

using namespace vigil;
using namespace std::chrono_literals;

class config_test : public ::testing::Test {
 protected:
  static config valid() {
    config cfg;
    cfg.name = "node-1";
    return cfg;
  }
};

VIGIL_TEST_F(config_test, config_read_from) {
  std::stringstream s{
      "{"
      "name: master-1, "
      "address: 10.0.0.1, "
      "gossip_port: 8946, "
      "rpc_address: 10.0.0.1, "
      "rpc_port: 8575, "
      "api_address: 127.0.0.1, "
      "api_port: 8580, "
      "tags: {role: master, zone: a}, "
      "peers: [node-1@10.0.0.2:7946, node-2@10.0.0.3:7946], "
      "status_update_period_ms: 10000, "
      "reply_timeout_ms: 5000, "
      "local_status_timeout_ms: 0, "
      "probe_timeout_ms: 1000, "
      "initialization_timeout_ms: 2000, "
      "max_concurrent_checkers: 4, "
      "history_capacity: 64, "
      "timeline_dir: /var/lib/vigil}"};
  auto cfg = config::read_from(s);
  ASSERT_EQ(cfg.name, "master-1");
  ASSERT_EQ(cfg.address, "10.0.0.1");
  ASSERT_EQ(cfg.gossip_port, 8946);
  ASSERT_EQ(cfg.rpc_address, "10.0.0.1");
  ASSERT_EQ(cfg.rpc_port, 8575);
  ASSERT_EQ(cfg.api_address, "127.0.0.1");
  ASSERT_EQ(cfg.api_port, 8580);
  ASSERT_EQ(cfg.tags.size(), 2);
  ASSERT_EQ(cfg.tags.at("role"), "master");
  ASSERT_EQ(cfg.peers.size(), 2);
  ASSERT_EQ(cfg.peers[1], "node-2@10.0.0.3:7946");
  ASSERT_EQ(cfg.status_update_period_ms, 10000);
  ASSERT_EQ(cfg.reply_timeout_ms, 5000);
  ASSERT_EQ(cfg.local_status_timeout_ms, 0);
  ASSERT_EQ(cfg.probe_timeout_ms, 1000);
  ASSERT_EQ(cfg.initialization_timeout_ms, 2000);
  ASSERT_EQ(cfg.max_concurrent_checkers, 4);
  ASSERT_EQ(cfg.history_capacity, 64);
  ASSERT_EQ(cfg.timeline_dir, "/var/lib/vigil");

  auto t = cfg.derived_timeouts();
  ASSERT_EQ(t.period, 10000ms);
  ASSERT_EQ(t.reply, 5000ms);
  // not overridden, still derived from the period
  ASSERT_EQ(t.local, 5625ms);
  ASSERT_EQ(t.probe, 1000ms);
  // derived local exceeds the overridden reply
  ASSERT_THROW(cfg.validate(), vigil::util::configuration_error);
  cfg.local_status_timeout_ms = 3000;
  cfg.validate();
  co_return;
}

VIGIL_TEST_F(config_test, defaults) {
  std::stringstream s{"{name: node-1}"};
  auto cfg = config::read_from(s);
  ASSERT_EQ(cfg.address, "127.0.0.1");
  ASSERT_EQ(cfg.gossip_port, 7946);
  ASSERT_EQ(cfg.rpc_port, 7575);
  ASSERT_EQ(cfg.api_port, 7580);
  ASSERT_EQ(cfg.status_update_period_ms, 30000);
  ASSERT_EQ(cfg.max_concurrent_checkers, 10);
  ASSERT_EQ(cfg.history_capacity, 256);
  ASSERT_TRUE(cfg.timeline_dir.empty());
  cfg.validate();
  co_return;
}

VIGIL_TEST_F(config_test, write_then_read) {
  auto cfg = valid();
  cfg.tags = {{"role", "master"}};
  cfg.peers = {"node-2@10.0.0.3:7946"};
  std::stringstream s;
  cfg.write_to(s);
  auto read = config::read_from(s);
  ASSERT_EQ(read.name, cfg.name);
  ASSERT_EQ(read.tags, cfg.tags);
  ASSERT_EQ(read.peers, cfg.peers);
  ASSERT_EQ(read.derived_timeouts(), cfg.derived_timeouts());
  co_return;
}

VIGIL_TEST_F(config_test, derive) {
  auto t = timeouts::derive(30000ms);
  ASSERT_EQ(t.period, 30000ms);
  ASSERT_EQ(t.reply, 22500ms);
  ASSERT_EQ(t.local, 16875ms);
  ASSERT_EQ(t.probe, 12656ms);
  t.validate();
  // too short to nest
  ASSERT_THROW(
      timeouts::derive(1ms).validate(), vigil::util::configuration_error);
  t.probe = t.local;
  ASSERT_THROW(t.validate(), vigil::util::configuration_error);
  co_return;
}

VIGIL_TEST_F(config_test, validate) {
  auto cfg = valid();
  cfg.validate();
  std::vector<std::function<void(config&)>> breakers{
      [](config& c) { c.name.clear(); },
      [](config& c) { c.gossip_port = 0; },
      [](config& c) { c.rpc_port = 0; },
      [](config& c) { c.api_port = 0; },
      [](config& c) { c.status_update_period_ms = 0; },
      [](config& c) { c.probe_timeout_ms = 100000; },
      [](config& c) { c.reply_timeout_ms = 30000; },
      [](config& c) { c.initialization_timeout_ms = 0; },
      [](config& c) { c.max_concurrent_checkers = 0; },
      [](config& c) { c.history_capacity = 0; },
  };
  for (size_t i = 0; i < breakers.size(); ++i) {
    auto broken = valid();
    breakers[i](broken);
    EXPECT_THROW(broken.validate(), vigil::util::configuration_error)
        << "case " << i + 1 << " failed";
  }
  co_return;
}

VIGIL_TEST_F(config_test, not_a_map) {
  std::stringstream s{"[1, 2]"};
  EXPECT_ANY_THROW(config::read_from(s));
  co_return;
}

}  // namespace
