//
// Created by jason on 2021/12/17.
//

#pragma once

#include <byteswap.h>
#include <endian.h>
#include <stdint.h>
#include <string.h>

#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "util/types.hh"

namespace vigil::util {

namespace endian {

template <typename T>
concept numerical =
    std::integral<T> || std::floating_point<T> || std::is_enum_v<T>;

template <numerical T>
inline T swap(T t) {
  if constexpr (sizeof(T) == 1) {
    return t;
  } else {
    using U = std::conditional_t<
        sizeof(T) == 2,
        uint16_t,
        std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>;
    U u;
    ::memcpy(&u, &t, sizeof(T));
    if constexpr (sizeof(T) == 2) {
      u = bswap_16(u);
    } else if constexpr (sizeof(T) == 4) {
      u = bswap_32(u);
    } else {
      u = bswap_64(u);
    }
    ::memcpy(&t, &u, sizeof(T));
    return t;
  }
}

template <numerical T>
inline T htole(T t) {
  if constexpr (__BYTE_ORDER != __LITTLE_ENDIAN) {
    return swap(t);
  }
  return t;
}

template <numerical T>
inline T letoh(T t) {
  return htole(t);
}

}  // namespace endian

template <typename T>
struct serializer;

template <typename T, typename Output>
inline void serialize(Output& o, const T& v) {
  serializer<T>::write(o, v);
}

template <typename T, typename Input>
inline T deserialize(Input& i, type<T>) {
  return serializer<T>::read(i);
}

template <typename T, typename Input>
inline void skip(Input& i, type<T>) {
  serializer<T>::skip(i);
}

namespace detail {

template <endian::numerical T>
struct numeric_serializer {
  template <typename Input>
  static T read(Input& i) {
    T data;
    i.read(reinterpret_cast<char*>(&data), sizeof(T));
    return endian::letoh(data);
  }

  template <typename Output>
  static void write(Output& o, T v) {
    v = endian::htole(v);
    o.write(reinterpret_cast<const char*>(&v), sizeof(T));
  }

  template <typename Input>
  static void skip(Input& i) {
    i.skip(sizeof(T));
  }
};

struct string_serializer {
  template <typename Input>
  static std::string read(Input& i) {
    auto size = deserialize(i, type<uint64_t>());
    std::string s;
    s.resize(size);
    i.read(s.data(), size);
    return s;
  }
  template <typename Output>
  static void write(Output& o, const std::string& s) {
    serialize(o, static_cast<uint64_t>(s.size()));
    o.write(s.data(), s.size());
  }
  template <typename Input>
  static void skip(Input& i) {
    i.skip(deserialize(i, type<uint64_t>()));
  }
};

template <typename T>
struct optional_serializer {
  template <typename Input>
  static std::optional<T> read(Input& i) {
    std::optional<T> v;
    if (deserialize(i, type<bool>())) {
      v.emplace(deserialize(i, type<T>()));
    }
    return v;
  }
  template <typename Output>
  static void write(Output& o, const std::optional<T>& p) {
    serialize(o, p.has_value());
    if (p) {
      serialize(o, *p);
    }
  }
  template <typename Input>
  static void skip(Input& i) {
    if (deserialize(i, type<bool>())) {
      serializer<T>::skip(i);
    }
  }
};

template <typename T>
struct vector_serializer {
  template <typename Input>
  static std::vector<T> read(Input& i) {
    auto size = deserialize(i, type<uint64_t>());
    std::vector<T> c;
    c.reserve(size);
    while (size--) {
      c.emplace_back(deserialize(i, type<T>()));
    }
    return c;
  }
  template <typename Output>
  static void write(Output& o, const std::vector<T>& c) {
    serialize(o, static_cast<uint64_t>(c.size()));
    for (const auto& v : c) {
      serialize(o, v);
    }
  }
  template <typename Input>
  static void skip(Input& i) {
    auto size = deserialize(i, type<uint64_t>());
    while (size--) {
      serializer<T>::skip(i);
    }
  }
};

template <typename K, typename V>
struct map_serializer {
  template <typename Input>
  static std::map<K, V> read(Input& i) {
    auto size = deserialize(i, type<uint64_t>());
    std::map<K, V> m;
    while (size--) {
      K k = deserialize(i, type<K>());
      V v = deserialize(i, type<V>());
      m.emplace(std::move(k), std::move(v));
    }
    return m;
  }
  template <typename Output>
  static void write(Output& o, const std::map<K, V>& m) {
    serialize(o, static_cast<uint64_t>(m.size()));
    for (const auto& [k, v] : m) {
      serialize(o, k);
      serialize(o, v);
    }
  }
  template <typename Input>
  static void skip(Input& i) {
    auto size = deserialize(i, type<uint64_t>());
    while (size--) {
      serializer<K>::skip(i);
      serializer<V>::skip(i);
    }
  }
};

}  // namespace detail

template <> struct serializer<bool>
  : public detail::numeric_serializer<bool> {};
template <> struct serializer<uint8_t>
  : public detail::numeric_serializer<uint8_t> {};
template <> struct serializer<uint16_t>
  : public detail::numeric_serializer<uint16_t> {};
template <> struct serializer<uint32_t>
  : public detail::numeric_serializer<uint32_t> {};
template <> struct serializer<int64_t>
  : public detail::numeric_serializer<int64_t> {};
template <> struct serializer<uint64_t>
  : public detail::numeric_serializer<uint64_t> {};
template <> struct serializer<double>
  : public detail::numeric_serializer<double> {};
template <> struct serializer<std::string>
  : public detail::string_serializer {};

template <typename T> struct serializer<std::optional<T>>
  : public detail::optional_serializer<T> {};
template <typename T> struct serializer<std::vector<T>>
  : public detail::vector_serializer<T> {};
template <typename K, typename V> struct serializer<std::map<K, V>>
  : public detail::map_serializer<K, V> {};

}  // namespace vigil::util
