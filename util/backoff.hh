//
// Created by jason on 2021/12/29.
//

#pragma once

#include <chrono>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/sleep.hh>

namespace vigil::util {

// Retries an attempt at a growing interval until it succeeds or
// the deadline is close. No attempt ever starts after the deadline.
template <typename Clock = seastar::lowres_clock>
class backoff {
 public:
  using duration = typename Clock::duration;
  using time_point = typename Clock::time_point;

  // the interval is multiplied by factor after every failed attempt and
  // never exceeds ceiling
  static backoff exponential(
      duration interval, double factor, duration ceiling = duration::max()) {
    backoff b(interval, factor < 1.0 ? 1.0 : factor);
    b._ceiling = ceiling;
    return b;
  }

  template <typename Func>
    requires requires(Func f) {
               { f() } -> std::same_as<seastar::future<bool>>;
             }
  seastar::future<bool> attempt_until(time_point deadline, Func func) const {
    auto wait = _interval;
    while (true) {
      if (co_await func()) {
        co_return true;
      }
      if (Clock::now() + wait >= deadline) {
        co_return false;
      }
      co_await seastar::sleep(wait);
      wait = std::min(
          _ceiling, std::chrono::duration_cast<duration>(wait * _factor));
    }
  }

 private:
  backoff(duration interval, double factor)
    : _interval(interval), _factor(factor) {}

  duration _interval;
  double _factor;
  duration _ceiling = duration::max();
};

}  // namespace vigil::util
