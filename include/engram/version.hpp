#pragma once

#define ENGRAM_VERSION_MAJOR 0
#define ENGRAM_VERSION_MINOR 1
#define ENGRAM_VERSION_PATCH 0

#define ENGRAM_VERSION_STRING "0.1.0"

// For compile-time version checks
#define ENGRAM_VERSION \
  (ENGRAM_VERSION_MAJOR * 10000 + ENGRAM_VERSION_MINOR * 100 + ENGRAM_VERSION_PATCH)

namespace engram {

inline const char* Version() { return ENGRAM_VERSION_STRING; }

}  // namespace engram
