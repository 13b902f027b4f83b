//
// Created by jason on 2022/10/12.
//

#pragma once

#include <optional>
#include <seastar/core/future.hh>
#include <string>
#include <vector>

#include "protocol/status.hh"
#include "util/seastarx.hh"

namespace vigil::membership {

// The gossip layer this agent rides on. It owns join/leave, failure
// detection, tag propagation and coordinates; the agent only reads it.
// Every call returns a snapshot, later gossip does not mutate it.
class substrate {
 public:
  virtual ~substrate() = default;
  virtual std::string name() const = 0;
  // all members known to the substrate regardless of their status
  virtual future<std::vector<protocol::cluster_member>> members() = 0;
  // returns the number of peers successfully contacted
  virtual future<size_t> join(std::vector<std::string> peers, bool replay) = 0;
  virtual future<> update_tags(
      protocol::tag_map add, std::vector<std::string> remove) = 0;
  virtual future<std::optional<protocol::coordinate>> get_coordinate(
      std::string node) = 0;
  virtual future<> close() = 0;
};

}  // namespace vigil::membership
