//
// Created by jason on 2022/4/16.
//

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>

// seastar names are used unqualified across vigil
namespace vigil {

using namespace seastar;

}  // namespace vigil
