//
// Created by jason on 2022/10/13.
//

#include "static_substrate.hh"

#include <charconv>

#include "membership/logger.hh"
#include "util/error.hh"

namespace vigil::membership {

static_substrate::static_substrate(protocol::cluster_member self) {
  self.status = protocol::member_status::alive;
  _members.emplace_back(std::move(self));
}

future<std::vector<protocol::cluster_member>> static_substrate::members() {
  if (_closed) [[unlikely]] {
    return make_exception_future<std::vector<protocol::cluster_member>>(
        util::closed_error("static_substrate"));
  }
  return make_ready_future<std::vector<protocol::cluster_member>>(_members);
}

future<size_t> static_substrate::join(
    std::vector<std::string> peers, bool replay) {
  if (_closed) [[unlikely]] {
    return make_exception_future<size_t>(
        util::closed_error("static_substrate"));
  }
  size_t joined = 0;
  for (const auto& peer : peers) {
    auto m = parse_peer(peer);
    if (!m) {
      l.warn("static_substrate::join: malformed peer {}", peer);
      continue;
    }
    if (auto* existing = find(m->name); existing != nullptr) {
      if (!replay && existing->is_alive()) {
        l.debug("static_substrate::join: {} already joined", m->name);
      }
      existing->address = m->address;
      existing->gossip_port = m->gossip_port;
      existing->status = protocol::member_status::alive;
    } else {
      m->status = protocol::member_status::alive;
      _members.emplace_back(std::move(*m));
    }
    ++joined;
  }
  return make_ready_future<size_t>(joined);
}

future<> static_substrate::update_tags(
    protocol::tag_map add, std::vector<std::string> remove) {
  if (_closed) [[unlikely]] {
    return make_exception_future<>(util::closed_error("static_substrate"));
  }
  auto& self = _members.front();
  for (auto& key : remove) {
    self.tags.erase(key);
  }
  for (auto& [k, v] : add) {
    self.tags[k] = std::move(v);
  }
  return make_ready_future<>();
}

future<std::optional<protocol::coordinate>> static_substrate::get_coordinate(
    std::string node) {
  // no network coordinates without a real gossip layer
  return make_ready_future<std::optional<protocol::coordinate>>(std::nullopt);
}

future<> static_substrate::close() {
  _closed = true;
  return make_ready_future<>();
}

bool static_substrate::set_status(
    std::string_view name, protocol::member_status status) {
  auto* m = find(name);
  if (m == nullptr) {
    return false;
  }
  m->status = status;
  return true;
}

bool static_substrate::set_tags(std::string_view name, protocol::tag_map tags) {
  auto* m = find(name);
  if (m == nullptr) {
    return false;
  }
  m->tags = std::move(tags);
  return true;
}

std::optional<protocol::cluster_member> static_substrate::parse_peer(
    std::string_view peer) {
  auto at = peer.find('@');
  auto colon = peer.rfind(':');
  if (at == std::string_view::npos || at == 0 ||
      colon == std::string_view::npos || colon <= at + 1 ||
      colon + 1 == peer.size()) {
    return std::nullopt;
  }
  auto port_str = peer.substr(colon + 1);
  uint16_t port = 0;
  auto [ptr, ec] = std::from_chars(
      port_str.data(), port_str.data() + port_str.size(), port);
  if (ec != std::errc() || ptr != port_str.data() + port_str.size() ||
      port == 0) {
    return std::nullopt;
  }
  protocol::cluster_member m;
  m.name = std::string(peer.substr(0, at));
  m.address = std::string(peer.substr(at + 1, colon - at - 1));
  m.gossip_port = port;
  return m;
}

protocol::cluster_member* static_substrate::find(std::string_view name) {
  for (auto& m : _members) {
    if (m.name == name) {
      return &m;
    }
  }
  return nullptr;
}

}  // namespace vigil::membership
