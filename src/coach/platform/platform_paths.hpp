#pragma once

#include <string>

namespace platform {

// Per-user directories; empty when neither XDG variables nor HOME are set.
std::string config_dir();
std::string data_dir();

} // namespace platform
