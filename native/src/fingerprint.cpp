#include "dotmask/fingerprint.h"

#include <cstdint>
#include <cstdio>

namespace dotmask {

std::string Fingerprint(std::string_view content) {
  const size_t len = content.size();
  if (len < kFingerprintSmallLimit) {
    return std::to_string(len) + ":" + std::string(content.substr(0, kFingerprintPrefix));
  }

  uint32_t hash = static_cast<uint32_t>(len);
  size_t samples = 0;
  for (size_t i = 0; i < len && samples < kFingerprintMaxSamples; i += kFingerprintStride, ++samples) {
    hash = hash * 31u + static_cast<unsigned char>(content[i]);
  }

  char hex[9];
  std::snprintf(hex, sizeof(hex), "%x", static_cast<unsigned>(hash));
  return std::to_string(len) + ":" + hex;
}

}  // namespace dotmask
