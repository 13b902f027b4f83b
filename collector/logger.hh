//
// Created by jason on 2022/10/13.
//

#pragma once

#include <seastar/util/log.hh>

namespace vigil::collector {

extern seastar::logger l;

}  // namespace vigil::collector
