//
// Created by jason on 2021/9/19.
//

#pragma once

#include <functional>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/future.hh>

namespace vigil::util {

// Catches SIGINT/SIGTERM on the current shard, and SIGHUP once a refresh
// callback is installed.
class stop_signal {
 public:
  stop_signal();
  ~stop_signal();
  // resolves with the caught signal number
  seastar::future<int> wait();
  bool stopping() const { return _caught; }

  // invoked on every SIGHUP until stopping
  void on_refresh(std::function<void()> func);
  uint64_t refreshes() const { return _refreshes; }

 private:
  void signaled(int signum);
  void refresh();

 private:
  int _signum = 0;
  bool _caught = false;
  uint64_t _refreshes = 0;
  std::function<void()> _refresh;
  seastar::condition_variable _cond;
};

}  // namespace vigil::util
