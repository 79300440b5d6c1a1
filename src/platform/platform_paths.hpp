#pragma once

#include <string>

namespace platform {

std::string config_dir();

} // namespace platform
