//
// Created by jason on 2022/10/18.
//

#include "render.hh"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <seastar/json/formatter.hh>

namespace vigil::render {

namespace {

std::string quote(std::string_view s) {
  return seastar::json::formatter::to_json(
      seastar::sstring(s.data(), s.size()));
}

int64_t unix_nano(protocol::timestamp t) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             t.time_since_epoch())
      .count();
}

template <typename T, typename Func>
std::string join_json(const T& items, Func&& func) {
  std::vector<std::string> parts;
  parts.reserve(items.size());
  for (const auto& item : items) {
    parts.emplace_back(func(item));
  }
  return fmt::format("{}", fmt::join(parts, ","));
}

std::string tags_json(const protocol::tag_map& tags) {
  return fmt::format("{{{}}}", join_json(tags, [](const auto& tag) {
                       return fmt::format(
                           "{}:{}", quote(tag.first), quote(tag.second));
                     }));
}

std::string probe_json(const protocol::probe_result& p) {
  return fmt::format(
      R"({{"checker":{},"succeeded":{},"detail":{}}})",
      quote(p.checker),
      p.succeeded,
      quote(p.detail));
}

std::string node_json(const protocol::node_status& n) {
  return fmt::format(
      R"({{"name":{},"address":{},"status":{},"memberStatus":{},)"
      R"("tags":{},"probes":[{}]}})",
      quote(n.name),
      quote(n.member.endpoint()),
      quote(protocol::name(n.status)),
      quote(protocol::name(n.member.status)),
      tags_json(n.member.tags),
      join_json(n.probes, probe_json));
}

// the fields after type, they differ per kind of event
std::string event_fields(const timeline::event& e) {
  if (const auto* p = std::get_if<timeline::probe_failed>(&e.kind)) {
    return fmt::format(
        R"(,"node":{},"probe":{})", quote(p->node), quote(p->probe));
  }
  if (const auto* s = std::get_if<timeline::probe_succeeded>(&e.kind)) {
    return fmt::format(
        R"(,"node":{},"probe":{})", quote(s->node), quote(s->probe));
  }
  if (const auto* le = std::get_if<timeline::leader_elected>(&e.kind)) {
    return fmt::format(
        R"(,"prev":{},"node":{})", quote(le->prev), quote(le->node));
  }
  if (!e.node().empty()) {
    return fmt::format(R"(,"node":{})", quote(e.node()));
  }
  return {};
}

std::string event_json(const timeline::event& e) {
  return fmt::format(
      R"({{"timestamp":{},"type":{}{}}})",
      e.unix_nano(),
      quote(e.type()),
      event_fields(e));
}

}  // namespace

std::string to_json(const protocol::system_status& status) {
  return fmt::format(
      R"({{"status":{},"summary":{},"timestamp":{},"nodes":[{}]}})",
      quote(protocol::name(status.status)),
      quote(status.summary),
      unix_nano(status.time),
      join_json(status.nodes, node_json));
}

std::string to_json(const protocol::node_status& status) {
  return node_json(status);
}

std::string to_json(const std::vector<timeline::event>& events) {
  return fmt::format("[{}]", join_json(events, event_json));
}

std::string unknown_json(std::string_view summary) {
  return fmt::format(
      R"({{"status":{},"summary":{},"nodes":[]}})",
      quote(protocol::name(protocol::status_type::unknown)),
      quote(summary));
}

}  // namespace vigil::render
