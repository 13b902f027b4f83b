//
// Created by jason on 2021/10/27.
//

#pragma once

#include "protocol/status.hh"
#include "util/serializer.hh"
#include "util/error.hh"
#include "util/types.hh"

namespace vigil::util {

using namespace protocol;

template <>
struct serializer<member_status>
  : public detail::numeric_serializer<member_status> {};
template <>
struct serializer<status_type>
  : public detail::numeric_serializer<status_type> {};

template <>
struct serializer<cluster_member> {
  template <typename Input>
  static cluster_member read(Input& i) {
    cluster_member v;
    v.name = deserialize(i, type<std::string>());
    v.address = deserialize(i, type<std::string>());
    v.gossip_port = deserialize(i, type<uint16_t>());
    v.tags = deserialize(i, type<tag_map>());
    v.status = deserialize(i, type<member_status>());
    if (v.status >= member_status::num_of_status) {
      throw serialization_error("cluster_member");
    }
    return v;
  }
  template <typename Output>
  static void write(Output& o, const cluster_member& v) {
    serialize(o, v.name);
    serialize(o, v.address);
    serialize(o, v.gossip_port);
    serialize(o, v.tags);
    serialize(o, v.status);
  }
  template <typename Input>
  static void skip(Input& i) {
    serializer<std::string>::skip(i);
    serializer<std::string>::skip(i);
    serializer<uint16_t>::skip(i);
    serializer<tag_map>::skip(i);
    serializer<member_status>::skip(i);
  }
};

template <>
struct serializer<probe_result> {
  template <typename Input>
  static probe_result read(Input& i) {
    probe_result v;
    v.node = deserialize(i, type<std::string>());
    v.checker = deserialize(i, type<std::string>());
    v.succeeded = deserialize(i, type<bool>());
    v.detail = deserialize(i, type<std::string>());
    return v;
  }
  template <typename Output>
  static void write(Output& o, const probe_result& v) {
    serialize(o, v.node);
    serialize(o, v.checker);
    serialize(o, v.succeeded);
    serialize(o, v.detail);
  }
  template <typename Input>
  static void skip(Input& i) {
    serializer<std::string>::skip(i);
    serializer<std::string>::skip(i);
    serializer<bool>::skip(i);
    serializer<std::string>::skip(i);
  }
};

template <>
struct serializer<node_status> {
  template <typename Input>
  static node_status read(Input& i) {
    node_status v;
    v.name = deserialize(i, type<std::string>());
    v.member = deserialize(i, type<cluster_member>());
    v.status = deserialize(i, type<status_type>());
    v.probes = deserialize(i, type<std::vector<probe_result>>());
    if (v.status >= status_type::num_of_type) {
      throw serialization_error("node_status");
    }
    return v;
  }
  template <typename Output>
  static void write(Output& o, const node_status& v) {
    serialize(o, v.name);
    serialize(o, v.member);
    serialize(o, v.status);
    serialize(o, v.probes);
  }
  template <typename Input>
  static void skip(Input& i) {
    serializer<std::string>::skip(i);
    serializer<cluster_member>::skip(i);
    serializer<status_type>::skip(i);
    serializer<std::vector<probe_result>>::skip(i);
  }
};

// nanoseconds since the unix epoch
template <>
struct serializer<timestamp> {
  template <typename Input>
  static timestamp read(Input& i) {
    auto ns = std::chrono::nanoseconds(deserialize(i, type<int64_t>()));
    return timestamp(std::chrono::duration_cast<clock::duration>(ns));
  }
  template <typename Output>
  static void write(Output& o, const timestamp& v) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        v.time_since_epoch());
    serialize(o, static_cast<int64_t>(ns.count()));
  }
  template <typename Input>
  static void skip(Input& i) {
    serializer<int64_t>::skip(i);
  }
};

template <>
struct serializer<system_status> {
  template <typename Input>
  static system_status read(Input& i) {
    system_status v;
    v.status = deserialize(i, type<status_type>());
    v.summary = deserialize(i, type<std::string>());
    v.time = deserialize(i, type<timestamp>());
    v.nodes = deserialize(i, type<std::vector<node_status>>());
    if (v.status >= status_type::num_of_type) {
      throw serialization_error("system_status");
    }
    return v;
  }
  template <typename Output>
  static void write(Output& o, const system_status& v) {
    serialize(o, v.status);
    serialize(o, v.summary);
    serialize(o, v.time);
    serialize(o, v.nodes);
  }
  template <typename Input>
  static void skip(Input& i) {
    serializer<status_type>::skip(i);
    serializer<std::string>::skip(i);
    serializer<timestamp>::skip(i);
    serializer<std::vector<node_status>>::skip(i);
  }
};

}  // namespace vigil::util

namespace vigil::protocol {

// the serializer tag handed to seastar::rpc
struct serializer {};

template <typename T, typename Output>
void write(serializer, Output& o, const T& v) {
  util::serialize(o, v);
}

template <typename T, typename Input>
T read(serializer, Input& i, util::type<T>) {
  return util::deserialize(i, util::type<T>());
}

}  // namespace vigil::protocol
