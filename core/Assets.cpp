#include "core/Assets.hpp"

#include <filesystem>
#include <system_error>

namespace assets {

namespace fs = std::filesystem;

std::string Path(const char *relative) {
  std::error_code ec;
  fs::path current = fs::current_path(ec);
  fs::path assetsPath = "assets";

  for (int i = 0; !ec && i < 4; ++i) {
    if (fs::is_directory(current / "assets", ec)) {
      assetsPath = current / "assets";
      break;
    }
    if (!current.has_parent_path() || current.parent_path() == current) {
      break;
    }
    current = current.parent_path();
  }

  return (assetsPath / relative).string();
}

} // namespace assets
