//
// Created by jason on 2022/5/28.
//

#pragma once

#include <seastar/http/httpd.hh>

#include "util/seastarx.hh"

namespace vigil {

class agent;

// health endpoint rendering the agent's statuses as JSON
class api_server {
 public:
  explicit api_server(agent& a, socket_address addr, listen_options lo);
  future<> start();
  future<> stop();
  void initialize_handlers();

 private:
  friend class status_handler;
  agent& _agent;
  socket_address _address;
  listen_options _options;
  http_server _server;
};

}  // namespace vigil
