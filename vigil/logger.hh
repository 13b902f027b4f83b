//
// Created by jason on 2022/10/17.
//

#pragma once

#include <seastar/util/log.hh>

namespace vigil {

extern seastar::logger l;

}  // namespace vigil
