//
// Created by jason on 2021/12/16.
//

#pragma once

#include <seastar/net/socket_defs.hh>
#include <seastar/rpc/rpc.hh>
#include <unordered_map>

#include "protocol/serializer.hh"
#include "transport/status_client.hh"
#include "util/seastarx.hh"

namespace vigil::transport {

namespace srpc = seastar::rpc;

enum class messaging_verb : int32_t {
  // for querying the status a peer collected on its own node
  local_status = 0,
  // the cluster status a peer last published
  status = 1,
  // the wall clock of a peer
  time = 2,
  // when a peer last heard from a member
  last_seen = 3,
  num_of_verb
};

std::string_view name(messaging_verb verb);

class exchanger final : public status_client {
 public:
  // default_peer_port is dialed when a member does not carry the rpc port
  // tag
  exchanger(
      std::string listen_address,
      uint16_t listen_port,
      uint16_t default_peer_port);
  ~exchanger() override = default;

  using rpc_protocol = srpc::protocol<protocol::serializer, messaging_verb>;
  using rpc_protocol_client =
      srpc::protocol<protocol::serializer, messaging_verb>::client;
  using rpc_protocol_server =
      srpc::protocol<protocol::serializer, messaging_verb>::server;

  struct peer_info {
    explicit peer_info(shared_ptr<rpc_protocol_client>&& client)
      : rpc_client(std::move(client)) {}

    shared_ptr<rpc_protocol_client> rpc_client;
    srpc::stats stats() const { return rpc_client->get_stats(); }
  };

  future<> start_listen();
  future<> shutdown();
  future<> start() { return start_listen(); }
  future<> stop() { return shutdown(); }

  future<protocol::node_status> local_status(
      protocol::cluster_member member,
      seastar::lowres_clock::time_point deadline) override;

  void register_local_status_handler(local_status_handler&& func) override {
    _notify_local_status = std::move(func);
  }

  // a peer that has not published any status yet fails the call with its
  // own error
  future<protocol::system_status> status(
      protocol::cluster_member member,
      seastar::lowres_clock::time_point deadline);
  future<protocol::timestamp> time(
      protocol::cluster_member member,
      seastar::lowres_clock::time_point deadline);
  // when the peer last heard from the member called name
  future<protocol::timestamp> last_seen(
      protocol::cluster_member member,
      std::string name,
      seastar::lowres_clock::time_point deadline);

  using status_handler = std::function<future<protocol::system_status>()>;
  using last_seen_handler =
      std::function<future<protocol::timestamp>(std::string)>;
  void register_status_handler(status_handler&& func) {
    _notify_status = std::move(func);
  }
  void register_last_seen_handler(last_seen_handler&& func) {
    _notify_last_seen = std::move(func);
  }

  // rpc endpoint of a member
  socket_address resolve(const protocol::cluster_member& member) const;

  uint64_t dropped(messaging_verb verb) const {
    return _dropped_messages[static_cast<int32_t>(verb)];
  }

 private:
  void finalize_handlers();

  // a refused connection is retried until the deadline, the peer is only
  // reported as not answering once it passes
  template <typename Ret, typename... Args>
  future<Ret> call(
      messaging_verb verb,
      protocol::cluster_member member,
      seastar::lowres_clock::time_point deadline,
      Args... args);

  shared_ptr<rpc_protocol_client> get_rpc_client(socket_address address);

  bool remove_rpc_client(socket_address address);

  std::string _listen_address;
  uint16_t _listen_port;
  uint16_t _default_peer_port;
  bool _shutting_down = false;
  uint64_t _dropped_messages[static_cast<int32_t>(messaging_verb::num_of_verb)];
  std::unique_ptr<rpc_protocol> _rpc;
  std::unique_ptr<rpc_protocol_server> _server;
  std::unordered_map<socket_address, peer_info> _clients;
  local_status_handler _notify_local_status;
  status_handler _notify_status;
  last_seen_handler _notify_last_seen;
};

}  // namespace vigil::transport
