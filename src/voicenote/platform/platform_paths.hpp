#pragma once

#include <string>

namespace platform {

// Per-user directories. Empty string when neither XDG nor HOME is set.
std::string config_dir();
std::string data_dir();

// Root for per-run segment scratch directories.
std::string scratch_dir();

} // namespace platform
