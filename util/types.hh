//
// Created by jason on 2021/9/22.
//

#pragma once

#include <boost/type.hpp>

#define DISALLOW_COPY_AND_ASSIGN(TypeName)                                     \
  TypeName(const TypeName&) = delete;                                          \
  TypeName& operator=(const TypeName&) = delete

#define DISALLOW_COPY_MOVE_AND_ASSIGN(TypeName)                                \
  TypeName(const TypeName&) = delete;                                          \
  TypeName& operator=(const TypeName&) = delete;                               \
  TypeName(TypeName&&) = delete;                                               \
  TypeName& operator=(TypeName&&) = delete


namespace vigil::util {

// tag for the serializers
using boost::type;

}  // namespace vigil::util
