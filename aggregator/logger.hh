//
// Created by jason on 2022/10/14.
//

#pragma once

#include <seastar/util/log.hh>

namespace vigil::aggregator {

extern seastar::logger l;

}  // namespace vigil::aggregator
