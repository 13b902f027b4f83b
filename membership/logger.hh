//
// Created by jason on 2022/10/12.
//

#pragma once

#include <seastar/util/log.hh>

namespace vigil::membership {

extern seastar::logger l;

}  // namespace vigil::membership
