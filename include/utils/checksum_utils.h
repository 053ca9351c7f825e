#ifndef CHECKSUM_UTILS_H
#define CHECKSUM_UTILS_H

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

// Change detection for values that are expensive to resend. The checksum is
// CRC-32 (zlib) over a canonical encoding, so it is stable across runs and
// builds but is not collision-proof: equal sums mean "probably unchanged".
//
// Canonical encoding, version 1:
//   "fullsync-checksum-v1:" + compact JSON of the value, with object keys
//   sorted bytewise, non-ASCII escaped as \uXXXX, integers in decimal and
//   floating point values in shortest round-trip form.
// Sums from different encoding versions must not be compared; bump
// ENCODING_VERSION whenever the encoding changes.
namespace ChecksumUtils {

constexpr int ENCODING_VERSION = 1;

std::string canonicalEncoding(const nlohmann::json &values);

uint32_t checksum(const nlohmann::json &values);

// True iff knownSums holds a sum under name that equals newSum.
bool stillValid(const std::map<std::string, uint32_t> &knownSums,
                const std::string &name, uint32_t newSum);

} // namespace ChecksumUtils

#endif
