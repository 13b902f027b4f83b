//
// Created by jason on 2022/9/6.
//

#pragma once

#include <seastar/core/sstring.hh>
#include <seastar/http/json_path.hh>

namespace vigil::api {

static const seastar::sstring name = "vigil";

// cluster status, 200 if running and 503 otherwise
extern const seastar::httpd::path_description clusterStatus;
// status collected on this node
extern const seastar::httpd::path_description localStatus;
// recent timeline events
extern const seastar::httpd::path_description statusHistory;

}  // namespace vigil::api
