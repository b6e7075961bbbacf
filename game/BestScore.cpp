#include "game/Game.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "core/Log.hpp"

int LoadBestScore(const char *path) {
  FILE *f = std::fopen(path, "rb");
  if (!f) {
    if (errno != ENOENT) {
      LOG_WARN("Unable to read best score from {}: {}", path,
               std::strerror(errno));
    }
    return 0;
  }

  char buffer[32] = {};
  const size_t read = std::fread(buffer, 1, sizeof(buffer) - 1, f);
  const bool readError = std::ferror(f) != 0;
  std::fclose(f);
  if (readError) {
    LOG_WARN("Unable to read best score from {}", path);
    return 0;
  }
  buffer[read] = '\0';

  char *end = nullptr;
  errno = 0;
  const long value = std::strtol(buffer, &end, 10);
  while (end && (*end == ' ' || *end == '\n' || *end == '\r' || *end == '\t')) {
    ++end;
  }
  if (end == buffer || (end && *end != '\0') || errno == ERANGE) {
    LOG_WARN("Ignoring malformed best score in {}", path);
    return 0;
  }
  if (value < 0 || value > 1000000000L) {
    LOG_WARN("Ignoring out-of-range best score {} in {}", value, path);
    return 0;
  }
  return static_cast<int>(value);
}

bool SaveBestScore(const char *path, const int value) {
  FILE *f = std::fopen(path, "wb");
  if (!f) {
    LOG_WARN("Unable to store best score in {}: {}", path,
             std::strerror(errno));
    return false;
  }
  const bool written = std::fprintf(f, "%d\n", value) > 0;
  const bool closed = std::fclose(f) == 0;
  if (!written || !closed) {
    LOG_WARN("Unable to store best score in {}", path);
    return false;
  }
  return true;
}
