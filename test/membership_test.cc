//
// Created by jason on 2022/10/12.
//

#include "membership/client.hh"
#include "membership/static_substrate.hh"

#include "test/base.hh"
#include "test/util.hh"
#include "util/error.hh"

namespace {

using namespace vigil;
using namespace vigil::protocol;
using namespace std::chrono_literals;

using helper = vigil::test::util;

// replays canned member lists, fails on demand
class fake_substrate final : public membership::substrate {
 public:
  std::string name() const override { return "fake"; }
  future<std::vector<cluster_member>> members() override {
    ++calls;
    if (failures > 0) {
      --failures;
      return make_exception_future<std::vector<cluster_member>>(
          std::runtime_error("gossip unavailable"));
    }
    return make_ready_future<std::vector<cluster_member>>(list);
  }
  future<size_t> join(std::vector<std::string> peers, bool) override {
    return make_ready_future<size_t>(std::min(peers.size(), reachable));
  }
  future<> update_tags(tag_map, std::vector<std::string>) override {
    return make_ready_future<>();
  }
  future<std::optional<coordinate>> get_coordinate(std::string) override {
    return make_ready_future<std::optional<coordinate>>(
        coordinate{.vec = {1, 2}});
  }
  future<> close() override { return make_ready_future<>(); }

  std::vector<cluster_member> list;
  int failures = 0;
  int calls = 0;
  size_t reachable = 0;
};

class membership_test : public ::testing::Test {
 protected:
  cluster_member with_status(std::string name, member_status s) {
    auto m = helper::member(std::move(name));
    m.status = s;
    return m;
  }
};

VIGIL_TEST_F(membership_test, members_are_alive_only) {
  fake_substrate s;
  s.list = {
      helper::master("master-1"),
      with_status("node-1", member_status::left),
      with_status("node-2", member_status::leaving),
      with_status("node-3", member_status::failed),
      with_status("node-4", member_status::none),
      helper::member("node-5")};
  membership::client c{s};
  auto members = co_await c.members();
  ASSERT_EQ(members.size(), 2);
  EXPECT_EQ(members[0].name, "master-1");
  EXPECT_EQ(members[1].name, "node-5");
  // the substrate still lists everyone
  EXPECT_EQ(s.list.size(), 6);
}

VIGIL_TEST_F(membership_test, substrate_failure_is_membership_error) {
  fake_substrate s;
  s.failures = 1;
  membership::client c{s};
  EXPECT_THROW(co_await c.members(), vigil::util::membership_error);
}

VIGIL_TEST_F(membership_test, find_member) {
  fake_substrate s;
  s.list = {
      helper::master("master-1"),
      with_status("node-1", member_status::left)};
  membership::client c{s};
  auto m = co_await c.find_member("master-1");
  EXPECT_TRUE(m.is_master());
  EXPECT_THROW(
      co_await c.find_member("node-1"), vigil::util::member_not_found_error);
  EXPECT_THROW(
      co_await c.find_member("nobody"), vigil::util::member_not_found_error);
}

VIGIL_TEST_F(membership_test, partial_join_is_not_an_error) {
  fake_substrate s;
  s.reachable = 1;
  membership::client c{s};
  auto joined = co_await c.join({"a@10.0.0.1:7946", "b@10.0.0.2:7946"}, false);
  EXPECT_EQ(joined, 1);
  EXPECT_THROW(co_await c.join({}, false), vigil::util::invalid_argument);
}

VIGIL_TEST_F(membership_test, coordinate_is_passed_through) {
  fake_substrate s;
  membership::client c{s};
  auto coord = co_await c.get_coordinate("node-1");
  ASSERT_TRUE(coord.has_value());
  EXPECT_EQ(coord->vec.size(), 2);
}

VIGIL_TEST_F(membership_test, is_member) {
  fake_substrate s;
  membership::client c{s};
  s.list = {helper::member("node-1")};
  EXPECT_FALSE(co_await c.is_member("node-1"));
  s.list = {helper::member("node-1"), helper::master("master-1")};
  EXPECT_TRUE(co_await c.is_member("node-1"));
  EXPECT_FALSE(co_await c.is_member("node-2"));
}

VIGIL_TEST_F(membership_test, wait_ready_retries) {
  fake_substrate s;
  s.failures = 2;
  membership::client c{s};
  co_await c.wait_ready(seastar::lowres_clock::now() + 2s);
  EXPECT_EQ(s.calls, 3);
}

VIGIL_TEST_F(membership_test, wait_ready_times_out) {
  fake_substrate s;
  s.failures = 1000;
  membership::client c{s};
  EXPECT_THROW(
      co_await c.wait_ready(seastar::lowres_clock::now() + 300ms),
      vigil::util::timed_out_error);
}

VIGIL_TEST_F(membership_test, closed_client_rejects) {
  fake_substrate s;
  membership::client c{s};
  co_await c.close();
  EXPECT_THROW(co_await c.members(), vigil::util::closed_error);
}

VIGIL_TEST_F(membership_test, parse_peer) {
  auto m = membership::static_substrate::parse_peer("node-1@10.0.0.1:7946");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->name, "node-1");
  EXPECT_EQ(m->address, "10.0.0.1");
  EXPECT_EQ(m->gossip_port, 7946);
  std::vector<std::string> bad{
      "node-1", "@10.0.0.1:7946", "node-1@:7946", "node-1@10.0.0.1",
      "node-1@10.0.0.1:", "node-1@10.0.0.1:port", "node-1@10.0.0.1:0",
      "node-1@10.0.0.1:70000"};
  for (const auto& peer : bad) {
    EXPECT_FALSE(membership::static_substrate::parse_peer(peer).has_value())
        << peer;
  }
  co_return;
}

VIGIL_TEST_F(membership_test, static_substrate) {
  membership::static_substrate s{helper::master("master-1")};
  membership::client c{s};
  auto joined = co_await c.join(
      {"node-1@10.0.0.1:7946", "garbage", "node-2@10.0.0.2:7946"}, false);
  EXPECT_EQ(joined, 2);
  EXPECT_EQ((co_await c.members()).size(), 3);
  EXPECT_TRUE(s.set_status("node-2", member_status::left));
  EXPECT_FALSE(s.set_status("node-9", member_status::left));
  auto members = co_await c.members();
  ASSERT_EQ(members.size(), 2);
  EXPECT_EQ(members[1].name, "node-1");

  co_await c.update_tags({{"leader", "true"}}, {"role"});
  auto self = co_await c.find_member("master-1");
  EXPECT_TRUE(self.is_leader());
  EXPECT_FALSE(self.is_master());
  EXPECT_FALSE((co_await c.get_coordinate("node-1")).has_value());

  // rejoining brings a departed member back
  EXPECT_EQ(co_await c.join({"node-2@10.0.0.2:7946"}, true), 1);
  EXPECT_EQ((co_await c.members()).size(), 3);
  co_await c.close();
  EXPECT_THROW(co_await s.members(), vigil::util::closed_error);
}

}  // namespace
