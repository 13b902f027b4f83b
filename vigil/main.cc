//
// Created by jason on 2022/5/22.
//

#include <fstream>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>

#include "membership/client.hh"
#include "membership/static_substrate.hh"
#include "timeline/journal_execer.hh"
#include "transport/exchanger.hh"
#include "util/error.hh"
#include "util/signal.hh"
#include "vigil/agent.hh"
#include "vigil/api_server.hh"
#include "vigil/logger.hh"

using namespace seastar;

static int vigil_main(int argc, char** argv, char** env) {
  namespace bpo = boost::program_options;
  app_template::config app_cfg;
  app_cfg.name = "vigil";
  app_cfg.description = "cluster health monitoring agent";
  app_cfg.auto_handle_sigint_sigterm = false;
  app_template app{std::move(app_cfg)};
  app.add_options()(
      "config_file",
      bpo::value<sstring>()->default_value(""),
      "vigil agent config file path");
  app.add_options()(
      "name", bpo::value<sstring>(), "agent name, overrides the config file");
  app.add_options()(
      "peer",
      bpo::value<std::vector<std::string>>(),
      "peer to join as name@host:port, can be repeated");

  return app.run(argc, argv, [&]() -> future<int> {
    vigil::l.info("vigil initializing...");
    auto&& opts = app.configuration();
    vigil::util::stop_signal stop_signal;
    vigil::config config;
    auto&& config_file = opts["config_file"].as<sstring>();
    if (!config_file.empty()) {
      std::ifstream ifs{config_file, std::ios::in};
      if (ifs.good()) {
        config = vigil::config::read_from(ifs);
      } else {
        vigil::l.error("bad config_file:{}", config_file);
        co_return 255;
      }
    }
    if (opts.count("name")) {
      config.name = opts["name"].as<sstring>();
    }
    if (opts.count("peer")) {
      auto peers = opts["peer"].as<std::vector<std::string>>();
      config.peers.insert(config.peers.end(), peers.begin(), peers.end());
    }
    try {
      config.validate();
    } catch (const vigil::util::configuration_error& ex) {
      vigil::l.error("invalid config: {}", ex.what());
      co_return 255;
    }
    vigil::l.info("{}", config);

    // starting procedure
    //  1. membership and storage, nothing is gossiped yet
    //  2. rpc, peers may ask for our local status from now on
    //  3. the agent joins and starts its status loop
    //  4. the health endpoint
    vigil::membership::static_substrate substrate{
        vigil::protocol::cluster_member{
            .name = config.name,
            .address = config.address,
            .gossip_port = config.gossip_port}};
    vigil::membership::client members{substrate};
    std::unique_ptr<vigil::timeline::journal_execer> journal;
    if (!config.timeline_dir.empty()) {
      journal = co_await vigil::timeline::journal_execer::open(
          config.timeline_dir);
    }
    // concrete checkers are plugged in here
    vigil::collector::registry checkers;
    vigil::transport::exchanger rpc{
        config.rpc_address, config.rpc_port, config.rpc_port};
    vigil::agent agent{config, members, checkers, rpc, journal.get()};
    rpc.register_local_status_handler(
        [&agent] { return agent.local_status(); });
    rpc.register_status_handler([&agent] {
      return seastar::futurize_invoke([&agent] { return agent.status(); });
    });
    rpc.register_last_seen_handler([&agent](std::string name) {
      return seastar::futurize_invoke(
          [&agent, name = std::move(name)] { return agent.last_seen(name); });
    });
    socket_address api_addr{
        net::inet_address{config.api_address}, config.api_port};
    listen_options api_opt{.reuse_address = true};
    vigil::api_server server{agent, api_addr, api_opt};

    bool started = true;
    try {
      co_await rpc.start();
      co_await agent.start();
      co_await server.start();
    } catch (const std::exception& ex) {
      vigil::l.error("vigil failed to start: {}", ex.what());
      started = false;
    }
    if (started) {
      stop_signal.on_refresh([&agent] { agent.refresh(); });
      vigil::l.info("vigil is up now");
      auto signum = co_await stop_signal.wait();
      vigil::l.info("vigil exiting... with {}:{}", signum, ::strsignal(signum));
    }
    co_await server.stop();
    co_await agent.stop();
    co_await rpc.stop();
    co_await members.close();
    if (journal) {
      co_await journal->close();
    }
    vigil::l.info("vigil is down now");
    co_return started ? 0 : 1;
  });
}

int main(int argc, char** argv, char** env) {
  return vigil_main(argc, argv, env);
}
