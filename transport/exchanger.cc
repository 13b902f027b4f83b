//
// Created by jason on 2021/12/16.
//

#include "exchanger.hh"

#include <cassert>
#include <charconv>
#include <chrono>
#include <seastar/core/coroutine.hh>
#include <seastar/net/inet_address.hh>

#include "transport/logger.hh"
#include "util/backoff.hh"
#include "util/error.hh"

namespace vigil::transport {

using namespace protocol;
using namespace std::chrono_literals;

seastar::logger l{"transport"};

std::string_view name(messaging_verb verb) {
  static std::string_view types[] = {
      "local_status",
      "status",
      "time",
      "last_seen",
  };
  static_assert(
      sizeof(types) / sizeof(types[0]) ==
      static_cast<int>(messaging_verb::num_of_verb));
  assert(verb < messaging_verb::num_of_verb);
  return types[static_cast<int32_t>(verb)];
}

namespace {

srpc::rpc_clock_type::time_point timeout_of(
    seastar::lowres_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<srpc::rpc_clock_type::duration>(
      deadline - seastar::lowres_clock::now());
  return srpc::rpc_clock_type::now() + left;
}

}  // namespace

exchanger::exchanger(
    std::string listen_address,
    uint16_t listen_port,
    uint16_t default_peer_port)
  : _listen_address(std::move(listen_address))
  , _listen_port(listen_port)
  , _default_peer_port(default_peer_port)
  , _dropped_messages{0}
  , _rpc(std::make_unique<rpc_protocol>(serializer{})) {
  _rpc->set_logger(&l);
}

future<> exchanger::start_listen() {
  finalize_handlers();
  l.info("exchanger::start_listen: {}:{}", _listen_address, _listen_port);
  srpc::server_options opts;
  opts.tcp_nodelay = true;
  auto address =
      socket_address{net::inet_address{_listen_address}, _listen_port};
  _server =
      std::make_unique<rpc_protocol_server>(*_rpc, std::move(opts), address);
  return make_ready_future<>();
}

future<> exchanger::shutdown() {
  if (_shutting_down) {
    co_return;
  }
  _shutting_down = true;
  if (_server) {
    co_await _server->stop();
  }
  co_await parallel_for_each(_clients, [](auto& peer) -> future<> {
    l.info("exchanger::shutdown: closing connection to {}", peer.first);
    co_await peer.second.rpc_client->stop();
  });
  _clients.clear();
  l.info("exchanger::shutdown: done");
}

template <typename Ret, typename... Args>
future<Ret> exchanger::call(
    messaging_verb verb,
    cluster_member member,
    seastar::lowres_clock::time_point deadline,
    Args... args) {
  if (_shutting_down) [[unlikely]] {
    co_return coroutine::exception(
        std::make_exception_ptr(util::closed_error("exchanger")));
  }
  auto address = resolve(member);
  auto rpc_handler = _rpc->make_client<Ret(Args...)>(verb);
  std::optional<Ret> reply;
  auto retry = util::backoff<>::exponential(20ms, 2.0, 200ms);
  auto answered = co_await retry.attempt_until(
      deadline, [&]() -> future<bool> {
        if (_shutting_down) {
          throw util::closed_error("exchanger");
        }
        auto client = get_rpc_client(address);
        try {
          reply.emplace(
              co_await rpc_handler(*client, timeout_of(deadline), args...));
          co_return true;
        } catch (const srpc::timeout_error&) {
          // connected but silent, retrying cannot help
          co_return true;
        } catch (const srpc::closed_error& ex) {
          l.debug("exchanger::call: {} to {} failed: {}",
                  name(verb),
                  address,
                  ex.what());
        }
        remove_rpc_client(address);
        co_return false;
      });
  if (!answered || !reply) {
    _dropped_messages[static_cast<int32_t>(verb)]++;
    co_return coroutine::exception(
        std::make_exception_ptr(util::timed_out_error(
            fmt::format("{} from {}", name(verb), member.name))));
  }
  co_return std::move(*reply);
}

future<node_status> exchanger::local_status(
    cluster_member member, seastar::lowres_clock::time_point deadline) {
  return call<node_status>(
      messaging_verb::local_status, std::move(member), deadline);
}

future<system_status> exchanger::status(
    cluster_member member, seastar::lowres_clock::time_point deadline) {
  return call<system_status>(
      messaging_verb::status, std::move(member), deadline);
}

future<timestamp> exchanger::time(
    cluster_member member, seastar::lowres_clock::time_point deadline) {
  return call<timestamp>(
      messaging_verb::time, std::move(member), deadline);
}

future<timestamp> exchanger::last_seen(
    cluster_member member,
    std::string name,
    seastar::lowres_clock::time_point deadline) {
  return call<timestamp>(
      messaging_verb::last_seen, std::move(member), deadline, std::move(name));
}

socket_address exchanger::resolve(const cluster_member& member) const {
  auto port = _default_peer_port;
  if (auto it = member.tags.find(std::string(rpc_port_tag));
      it != member.tags.end()) {
    uint16_t tagged = 0;
    const auto& s = it->second;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), tagged);
    if (ec == std::errc() && ptr == s.data() + s.size() && tagged != 0) {
      port = tagged;
    } else {
      l.warn("exchanger::resolve: invalid rpc port {} of {}", s, member.name);
    }
  }
  return socket_address{net::inet_address{member.address}, port};
}

void exchanger::finalize_handlers() {
  if (!_notify_local_status) {
    throw util::panic("local status handler not set");
  }
  if (!_notify_status) {
    throw util::panic("status handler not set");
  }
  if (!_notify_last_seen) {
    throw util::panic("last seen handler not set");
  }
  // handlers maybe set during test
  if (!_rpc->has_handler(messaging_verb::local_status)) {
    _rpc->register_handler(
        messaging_verb::local_status,
        [this](const srpc::client_info& info) -> future<node_status> {
          l.trace("exchanger: local_status queried by {}", info.addr);
          return _notify_local_status();
        });
  }
  if (!_rpc->has_handler(messaging_verb::status)) {
    _rpc->register_handler(
        messaging_verb::status,
        [this](const srpc::client_info& info) -> future<system_status> {
          l.trace("exchanger: status queried by {}", info.addr);
          return _notify_status();
        });
  }
  if (!_rpc->has_handler(messaging_verb::time)) {
    _rpc->register_handler(
        messaging_verb::time,
        [](const srpc::client_info& info) -> future<timestamp> {
          l.trace("exchanger: time queried by {}", info.addr);
          return make_ready_future<timestamp>(protocol::clock::now());
        });
  }
  if (!_rpc->has_handler(messaging_verb::last_seen)) {
    _rpc->register_handler(
        messaging_verb::last_seen,
        [this](const srpc::client_info& info, std::string name)
            -> future<timestamp> {
          l.trace("exchanger: last_seen of {} queried by {}", name, info.addr);
          return _notify_last_seen(std::move(name));
        });
  }
}

shared_ptr<exchanger::rpc_protocol_client> exchanger::get_rpc_client(
    socket_address address) {
  auto it = _clients.find(address);
  if (it != _clients.end()) {
    auto client = it->second.rpc_client;
    if (!client->error()) {
      return client;
    }
    remove_rpc_client(address);
  }

  srpc::client_options opts;
  opts.keepalive = {60s, 60s, 10};
  opts.tcp_nodelay = true;
  opts.reuseaddr = true;
  auto client =
      make_shared<rpc_protocol_client>(*_rpc, std::move(opts), address);
  auto ret = _clients.emplace(address, peer_info(std::move(client)));
  return ret.first->second.rpc_client;
}

bool exchanger::remove_rpc_client(socket_address address) {
  if (_shutting_down) {
    return false;
  }
  auto it = _clients.find(address);
  if (it == _clients.end()) {
    return false;
  }
  auto client = std::move(it->second.rpc_client);
  _clients.erase(it);
  (void)client->stop().finally([address, client] {
    l.debug("exchanger::remove_rpc_client: dropped connection to {}", address);
  });
  return true;
}

}  // namespace vigil::transport
