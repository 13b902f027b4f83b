//
// Created by jason on 2022/10/18.
//

#include "vigil/render.hh"

#include "test/base.hh"
#include "test/util.hh"

namespace {

using namespace vigil;
using namespace vigil::protocol;

using helper = vigil::test::util;

class render_test : public ::testing::Test {};

VIGIL_TEST_F(render_test, node_status) {
  auto m = helper::member("node-1");
  auto n = helper::node(m, {{"disk", true}});
  EXPECT_EQ(
      render::to_json(n),
      R"({"name":"node-1","address":"127.0.0.1:7946","status":"running",)"
      R"("memberStatus":"alive","tags":{"role":"node"},)"
      R"("probes":[{"checker":"disk","succeeded":true,"detail":""}]})");
  co_return;
}

VIGIL_TEST_F(render_test, system_status_quotes_summary) {
  system_status s;
  s.status = status_type::degraded;
  s.summary = R"(node "a" is degraded)";
  auto json = render::to_json(s);
  EXPECT_NE(json.find(R"("status":"degraded")"), std::string::npos) << json;
  EXPECT_NE(
      json.find(R"("summary":"node \"a\" is degraded")"), std::string::npos)
      << json;
  EXPECT_NE(json.find(R"("nodes":[])"), std::string::npos) << json;
  co_return;
}

VIGIL_TEST_F(render_test, values_are_escaped) {
  auto m = helper::member("node-1");
  m.tags["zone"] = R"(rack "7")";
  auto n = helper::node(m, {{R"(disk "a")", false}});
  EXPECT_EQ(
      render::to_json(n),
      R"({"name":"node-1","address":"127.0.0.1:7946","status":"degraded",)"
      R"("memberStatus":"alive","tags":{"role":"node","zone":"rack \"7\""},)"
      R"("probes":[{"checker":"disk \"a\"","succeeded":false,)"
      R"("detail":"failed"}]})");
  co_return;
}

VIGIL_TEST_F(render_test, system_status_lists_nodes) {
  auto s = helper::running(
      {helper::node(helper::master("master-1")),
       helper::node(helper::member("node-1"))});
  s.time = timestamp{};
  EXPECT_EQ(
      render::to_json(s),
      R"({"status":"running","summary":"","timestamp":0,"nodes":[)"
      R"({"name":"master-1","address":"127.0.0.1:7946","status":"running",)"
      R"("memberStatus":"alive","tags":{"role":"master"},"probes":[]},)"
      R"({"name":"node-1","address":"127.0.0.1:7946","status":"running",)"
      R"("memberStatus":"alive","tags":{"role":"node"},"probes":[]}]})");
  co_return;
}

VIGIL_TEST_F(render_test, events) {
  auto now = clock::now();
  std::vector<timeline::event> events{
      {now, timeline::cluster_degraded{}},
      {now, timeline::node_removed{"node-2"}},
      {now, timeline::probe_failed{"node-1", "disk"}},
      {now, timeline::leader_elected{"master-1", "master-2"}},
  };
  auto json = render::to_json(events);
  EXPECT_EQ(json.front(), '[');
  EXPECT_EQ(json.back(), ']');
  EXPECT_NE(json.find(R"("type":"cluster_degraded"})"), std::string::npos);
  EXPECT_NE(json.find(R"("type":"node_removed","node":"node-2")"),
            std::string::npos);
  EXPECT_NE(json.find(R"("node":"node-1","probe":"disk")"), std::string::npos);
  EXPECT_NE(json.find(R"("prev":"master-1","node":"master-2")"),
            std::string::npos);
  EXPECT_EQ(render::to_json(std::vector<timeline::event>{}), "[]");
  co_return;
}

VIGIL_TEST_F(render_test, unknown) {
  EXPECT_EQ(
      render::unknown_json("no status collected yet"),
      R"({"status":"unknown","summary":"no status collected yet","nodes":[]})");
  co_return;
}

}  // namespace
