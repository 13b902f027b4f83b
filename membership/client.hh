//
// Created by jason on 2022/10/12.
//

#pragma once

#include <seastar/core/lowres_clock.hh>

#include "membership/substrate.hh"
#include "util/types.hh"

namespace vigil::membership {

// client is the only door from the agent to the substrate. It hides
// members that are not alive so that a departed node is never reported
// as missing by the aggregation.
class client {
 public:
  explicit client(substrate& s) : _substrate(s) {}
  DISALLOW_COPY_MOVE_AND_ASSIGN(client);

  // alive members only, a fresh vector per call
  future<std::vector<protocol::cluster_member>> members();

  // alive member with the given name, fails with member_not_found_error
  future<protocol::cluster_member> find_member(std::string name);

  // best effort, a partial join is not an error
  future<size_t> join(std::vector<std::string> peers, bool replay);

  future<> update_tags(protocol::tag_map add, std::vector<std::string> remove);

  future<std::optional<protocol::coordinate>> get_coordinate(std::string node);

  // self is an alive member of a cluster with other members
  future<bool> is_member(std::string self);

  // retries members() until it succeeds, fails with timed_out_error once
  // the deadline is reached
  future<> wait_ready(seastar::lowres_clock::time_point deadline);

  future<> close();

  static std::vector<protocol::cluster_member> filter_alive(
      std::vector<protocol::cluster_member> members);

 private:
  substrate& _substrate;
  bool _closed = false;
};

}  // namespace vigil::membership
