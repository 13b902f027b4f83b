//
// Created by jason on 2021/9/15.
//

#include "base.hh"

#include <pthread.h>

#include <csignal>
#include <cstring>
#include <seastar/core/coroutine.hh>

#include "util/signal.hh"

using namespace seastar;

namespace vigil::test {

seastar::logger l{"vigil_test"};

base::base(int argc, char** argv) : _args(argv, argv + argc) {
  // the agent never leaves shard 0
  _args.emplace_back("--smp=1");
  for (auto& arg : _args) {
    _argv.push_back(arg.data());
  }
}

void base::SetUp() {
  app_template::config app_cfg;
  app_cfg.name = "vigil_test";
  app_cfg.auto_handle_sigint_sigterm = false;
  _app = std::make_unique<app_template>(std::move(app_cfg));
  std::promise<void> started;
  auto ready = started.get_future();
  _reactor = std::thread([this, &started] {
    return _app->run(
        static_cast<int>(_argv.size()),
        _argv.data(),
        [&started]() -> future<> {
          vigil::util::stop_signal stop;
          l.info("reactor started");
          started.set_value();
          auto signum = co_await stop.wait();
          l.info("reactor stopping, caught {}", ::strsignal(signum));
        });
  });
  ready.get();
}

void base::TearDown() {
  // drain whatever the last test left queued before signalling
  run([] { return make_ready_future<>(); });
  if (auto ret = ::pthread_kill(_reactor.native_handle(), SIGTERM); ret) {
    l.error("failed to stop the reactor: {}", ::strerror(ret));
    std::abort();
  }
  _reactor.join();
}

void base::run(std::function<seastar::future<>()> func) {
  alien::submit_to(*alien::internal::default_instance, 0, std::move(func))
      .get();
}

}  // namespace vigil::test

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new vigil::test::base(argc, argv));
  return RUN_ALL_TESTS();
}
