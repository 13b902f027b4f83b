//
// Created by jason on 2022/10/12.
//

#include "client.hh"

#include <algorithm>
#include <seastar/core/coroutine.hh>

#include "membership/logger.hh"
#include "util/backoff.hh"
#include "util/error.hh"

namespace vigil::membership {

using namespace std::chrono_literals;

seastar::logger l{"membership"};

future<std::vector<protocol::cluster_member>> client::members() {
  if (_closed) [[unlikely]] {
    co_return coroutine::exception(
        std::make_exception_ptr(util::closed_error("membership")));
  }
  std::vector<protocol::cluster_member> all;
  try {
    all = co_await _substrate.members();
  } catch (const util::base_error&) {
    throw;
  } catch (const std::exception& ex) {
    throw util::membership_error(fmt::format(
        "{} failed to list members: {}", _substrate.name(), ex.what()));
  }
  auto total = all.size();
  auto alive = filter_alive(std::move(all));
  if (alive.size() != total) {
    l.debug("client::members: {} of {} members alive", alive.size(), total);
  }
  co_return alive;
}

future<protocol::cluster_member> client::find_member(std::string name) {
  auto members = co_await this->members();
  for (auto& m : members) {
    if (m.name == name) {
      co_return std::move(m);
    }
  }
  co_return coroutine::exception(
      std::make_exception_ptr(util::member_not_found_error(name)));
}

future<size_t> client::join(std::vector<std::string> peers, bool replay) {
  if (_closed) [[unlikely]] {
    co_return coroutine::exception(
        std::make_exception_ptr(util::closed_error("membership")));
  }
  if (peers.empty()) {
    co_return coroutine::exception(
        std::make_exception_ptr(util::invalid_argument("peers", "empty")));
  }
  auto expected = peers.size();
  auto joined = co_await _substrate.join(std::move(peers), replay);
  if (joined < expected) {
    l.warn("client::join: joined {} of {} peers", joined, expected);
  } else {
    l.info("client::join: joined {} peers", joined);
  }
  co_return joined;
}

future<> client::update_tags(
    protocol::tag_map add, std::vector<std::string> remove) {
  if (_closed) [[unlikely]] {
    return make_exception_future<>(util::closed_error("membership"));
  }
  return _substrate.update_tags(std::move(add), std::move(remove));
}

future<std::optional<protocol::coordinate>> client::get_coordinate(
    std::string node) {
  if (_closed) [[unlikely]] {
    return make_exception_future<std::optional<protocol::coordinate>>(
        util::closed_error("membership"));
  }
  return _substrate.get_coordinate(std::move(node));
}

future<bool> client::is_member(std::string self) {
  auto members = co_await this->members();
  // being the only member usually means the join has not happened yet
  if (members.size() == 1 && members.front().name == self) {
    co_return false;
  }
  co_return std::any_of(members.begin(), members.end(), [&](const auto& m) {
    return m.name == self;
  });
}

future<> client::wait_ready(seastar::lowres_clock::time_point deadline) {
  auto b = util::backoff<>::exponential(50ms, 2.0, 1s);
  auto ready = co_await b.attempt_until(deadline, [this]() -> future<bool> {
    try {
      co_await members();
      co_return true;
    } catch (const util::closed_error&) {
      throw;
    } catch (const std::exception& ex) {
      l.warn(
          "client::wait_ready: {} not ready: {}",
          _substrate.name(),
          ex.what());
    }
    co_return false;
  });
  if (!ready) {
    co_await coroutine::return_exception(
        util::timed_out_error("membership readiness"));
  }
}

future<> client::close() {
  if (_closed) {
    return make_ready_future<>();
  }
  _closed = true;
  return _substrate.close();
}

std::vector<protocol::cluster_member> client::filter_alive(
    std::vector<protocol::cluster_member> members) {
  std::erase_if(members, [](const auto& m) { return !m.is_alive(); });
  return members;
}

}  // namespace vigil::membership
