//
// Created by jason on 2022/5/28.
//

#include "api_server.hh"

#include "api/api.hh"
#include "util/error.hh"
#include "vigil/agent.hh"
#include "vigil/logger.hh"
#include "vigil/render.hh"

namespace vigil {

using namespace seastar;
using namespace httpd;

class status_handler : public handler_base {
 public:
  explicit status_handler(std::string_view tag, api_server* server)
    : _tag(tag), _server(server) {}

 protected:
  agent& ag() { return _server->_agent; }

  static std::unique_ptr<reply> respond(
      std::unique_ptr<reply> resp, reply::status_type code, std::string body) {
    resp->set_status(code);
    resp->write_body("json", sstring(body.data(), body.size()));
    return resp;
  }

  std::string _tag;
  api_server* _server;
};

class cluster_status_handler : public status_handler {
 public:
  using status_handler::status_handler;
  future<std::unique_ptr<reply>> handle(
      const sstring& path,
      std::unique_ptr<request> req,
      std::unique_ptr<reply> resp) override {
    try {
      auto status = ag().status();
      auto code = status.running() ? reply::status_type::ok
                                   : reply::status_type::service_unavailable;
      co_return respond(std::move(resp), code, render::to_json(status));
    } catch (const util::no_data_error& ex) {
      co_return respond(
          std::move(resp),
          reply::status_type::service_unavailable,
          render::unknown_json(ex.what()));
    }
  }
};

class local_status_handler : public status_handler {
 public:
  using status_handler::status_handler;
  future<std::unique_ptr<reply>> handle(
      const sstring& path,
      std::unique_ptr<request> req,
      std::unique_ptr<reply> resp) override {
    try {
      auto status = co_await ag().local_status();
      auto code = status.running() ? reply::status_type::ok
                                   : reply::status_type::service_unavailable;
      co_return respond(std::move(resp), code, render::to_json(status));
    } catch (const util::no_data_error& ex) {
      co_return respond(
          std::move(resp),
          reply::status_type::service_unavailable,
          render::unknown_json(ex.what()));
    }
  }
};

class history_handler : public status_handler {
 public:
  using status_handler::status_handler;
  future<std::unique_ptr<reply>> handle(
      const sstring& path,
      std::unique_ptr<request> req,
      std::unique_ptr<reply> resp) override {
    auto body = render::to_json(ag().history());
    return make_ready_future<std::unique_ptr<reply>>(
        respond(std::move(resp), reply::status_type::ok, std::move(body)));
  }
};

api_server::api_server(agent& a, socket_address addr, listen_options lo)
  : _agent(a), _address(addr), _options(lo), _server(api::name) {
  initialize_handlers();
}

future<> api_server::start() {
  l.info("api_server starting on {}...", _address);
  return _server.listen(_address, _options);
}

future<> api_server::stop() {
  l.info("api_server stopping...");
  return _server.stop();
}

void api_server::initialize_handlers() {
  api::clusterStatus.set(
      _server._routes, new cluster_status_handler{"clusterStatus", this});
  api::localStatus.set(
      _server._routes, new local_status_handler{"localStatus", this});
  api::statusHistory.set(
      _server._routes, new history_handler{"statusHistory", this});
}

}  // namespace vigil
