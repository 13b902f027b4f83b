//
// Created by jason on 2022/10/15.
//

#pragma once

#include <seastar/util/log.hh>

namespace vigil::timeline {

extern seastar::logger l;

}  // namespace vigil::timeline
