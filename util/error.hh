//
// Created by jason on 2021/10/8.
//

#pragma once

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <exception>
#include <string_view>

namespace vigil::util {

enum class code : uint8_t {
  ok = 0,
  panic,
  configuration,
  invalid_argument,
  // membership
  membership,
  member_not_found,
  // peers and services
  closed,
  timed_out,
  no_data,
  // wire and disk
  serialization,
  short_write,
  storage,
  num_of_codes,
};

std::string_view status_string(enum code e);

// Every error raised by vigil. The message always starts with the code
// name so that a logged what() is enough to classify a failure.
class base_error : public std::exception {
 public:
  explicit base_error(enum code e) : _e(e), _msg(status_string(e)) {}
  base_error(enum code e, std::string msg) : _e(e), _msg(std::move(msg)) {}
  template <typename... Args>
  base_error(std::string_view s, enum code e, Args&&... args)
    : _e(e)
    , _msg(fmt::format(
          fmt::runtime(s), status_string(e), std::forward<Args>(args)...)) {}

  code error_code() const noexcept { return _e; }

  const char* what() const noexcept override { return _msg.c_str(); }

 protected:
  enum code _e;
  std::string _msg;
};

// a broken internal contract, never caught by the agent
class panic : public base_error {
 public:
  explicit panic(std::string_view msg)
    : base_error("{}: {}", code::panic, msg) {}
};

class configuration_error : public base_error {
 public:
  configuration_error(std::string_view key, std::string_view msg)
    : base_error("{}: key:{}, reason:{}", code::configuration, key, msg) {}
};

class invalid_argument : public base_error {
 public:
  invalid_argument(std::string_view arg, std::string_view msg)
    : base_error("{}: arg:{}, reason:{}", code::invalid_argument, arg, msg) {}
};

// the gossip substrate cannot produce a member list at all
class membership_error : public base_error {
 public:
  using base_error::base_error;
  explicit membership_error(std::string_view msg)
    : base_error("{}: {}", code::membership, msg) {}
};

class member_not_found_error : public membership_error {
 public:
  explicit member_not_found_error(std::string_view name)
    : membership_error("{}: {}", code::member_not_found, name) {}
};

class closed_error : public base_error {
 public:
  closed_error() : base_error(code::closed) {}
  explicit closed_error(std::string_view service)
    : base_error("{}: service {} closed", code::closed, service) {}
};

// a peer or a checker did not answer before its deadline
class timed_out_error : public base_error {
 public:
  explicit timed_out_error(std::string_view what)
    : base_error("{}: {}", code::timed_out, what) {}
};

// nothing has been collected yet
class no_data_error : public base_error {
 public:
  explicit no_data_error(std::string_view msg)
    : base_error("{}: {}", code::no_data, msg) {}
};

class serialization_error : public base_error {
 public:
  explicit serialization_error(std::string_view type)
    : base_error("{}: failed type:{}", code::serialization, type) {}
};

class io_error : public base_error {
 public:
  using base_error::base_error;
};

class short_write_error : public io_error {
 public:
  explicit short_write_error(std::string_view path)
    : io_error("{}: {}", code::short_write, path) {}
};

// the timeline journal rejected a write
class storage_error : public io_error {
 public:
  explicit storage_error(std::string_view msg)
    : io_error("{}: {}", code::storage, msg) {}
};

}  // namespace vigil::util
