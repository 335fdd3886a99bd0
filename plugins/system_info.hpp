#pragma once

#include "protocol.hpp"

#include <cstdint>
#include <string>

namespace stavily::plugins {

/// {"hostname", "platform"} from uname(2).
Json system_info();

std::string hostname();

int64_t epoch_seconds();

} // namespace stavily::plugins
