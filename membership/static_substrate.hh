//
// Created by jason on 2022/10/13.
//

#pragma once

#include "membership/substrate.hh"
#include "util/types.hh"

namespace vigil::membership {

// In-process substrate used when no gossip library is wired in. The
// member list is whatever was joined, every joined peer is alive until
// set_status says otherwise.
class static_substrate final : public substrate {
 public:
  explicit static_substrate(protocol::cluster_member self);
  DISALLOW_COPY_MOVE_AND_ASSIGN(static_substrate);

  std::string name() const override { return "static"; }
  future<std::vector<protocol::cluster_member>> members() override;
  future<size_t> join(std::vector<std::string> peers, bool replay) override;
  future<> update_tags(
      protocol::tag_map add, std::vector<std::string> remove) override;
  future<std::optional<protocol::coordinate>> get_coordinate(
      std::string node) override;
  future<> close() override;

  // returns false if no such member
  bool set_status(std::string_view name, protocol::member_status status);
  // replaces the tags of a peer, for tests and operators
  bool set_tags(std::string_view name, protocol::tag_map tags);

  // parses "name@host:port", nullopt if malformed
  static std::optional<protocol::cluster_member> parse_peer(
      std::string_view peer);

 private:
  protocol::cluster_member* find(std::string_view name);

  // self always comes first
  std::vector<protocol::cluster_member> _members;
  bool _closed = false;
};

}  // namespace vigil::membership
