//
// Created by jason on 2021/9/19.
//

#include "signal.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/reactor.hh>

using namespace seastar;

namespace vigil::util {

stop_signal::stop_signal() {
  engine().handle_signal(SIGINT, [this] { signaled(SIGINT); });
  engine().handle_signal(SIGTERM, [this] { signaled(SIGTERM); });
}

stop_signal::~stop_signal() {
  // handlers cannot be unregistered, leave no-op ones behind
  engine().handle_signal(SIGINT, [] {});
  engine().handle_signal(SIGTERM, [] {});
  if (_refresh) {
    engine().handle_signal(SIGHUP, [] {});
  }
}

future<int> stop_signal::wait() {
  co_await _cond.wait([this] { return _caught; });
  co_return _signum;
}

void stop_signal::on_refresh(std::function<void()> func) {
  _refresh = std::move(func);
  engine().handle_signal(SIGHUP, [this] { refresh(); });
}

void stop_signal::signaled(int signum) {
  if (_caught) {
    return;
  }
  _signum = signum;
  _caught = true;
  _cond.broadcast();
}

void stop_signal::refresh() {
  if (_caught || !_refresh) {
    return;
  }
  ++_refreshes;
  _refresh();
}

}  // namespace vigil::util
