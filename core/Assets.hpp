#pragma once

#include <string>

// Asset path helpers. The executables may run from the build tree, so the
// assets/ directory is searched for upward from the working directory.
//
// Usage:
//   Tuning tuning{};
//   LoadTuningFromFile(tuning, assets::Path("tuning.json").c_str());

namespace assets {

// Returns "<found assets dir>/<relative>", or "assets/<relative>" when no
// assets directory exists within three parent levels.
std::string Path(const char *relative);

} // namespace assets
