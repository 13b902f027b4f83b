//
// Created by jason on 2022/9/6.
//

#include "api.hh"

namespace vigil::api {

using seastar::httpd::GET;
using seastar::httpd::path_description;

const path_description clusterStatus("/", GET, "clusterStatus", {}, {});

const path_description localStatus("/local", GET, "localStatus", {}, {});

const path_description statusHistory("/history", GET, "statusHistory", {}, {});

}  // namespace vigil::api
