//
// Created by jason on 2022/10/18.
//

#pragma once

#include <string>
#include <vector>

#include "protocol/status.hh"
#include "timeline/event.hh"

namespace vigil::render {

// JSON documents served by the health endpoint

std::string to_json(const protocol::system_status& status);

std::string to_json(const protocol::node_status& status);

std::string to_json(const std::vector<timeline::event>& events);

// body of a status that cannot be produced, e.g. before the first cycle
std::string unknown_json(std::string_view summary);

}  // namespace vigil::render
