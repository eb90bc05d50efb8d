#ifndef DOTMASK_FINGERPRINT_H
#define DOTMASK_FINGERPRINT_H

#include <cstddef>
#include <string>
#include <string_view>

namespace dotmask {

constexpr size_t kFingerprintSmallLimit = 512;
constexpr size_t kFingerprintPrefix = 64;
constexpr size_t kFingerprintStride = 16;
constexpr size_t kFingerprintMaxSamples = 512;

// Cheap cache key for document content. Not collision resistant: short inputs are keyed
// by length and prefix, longer ones by length and a sampled 32-bit rolling hash.
std::string Fingerprint(std::string_view content);

}  // namespace dotmask

#endif
