//
// Created by jason on 2021/12/16.
//

#pragma once

#include <seastar/util/log.hh>

namespace vigil::transport {

extern seastar::logger l;

}  // namespace vigil::transport
