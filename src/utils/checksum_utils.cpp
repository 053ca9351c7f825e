#include "utils/checksum_utils.h"
#include <zlib.h>

namespace ChecksumUtils {

std::string canonicalEncoding(const nlohmann::json &values) {
  // nlohmann::json keeps object members in a std::map, so dump() already
  // emits keys in sorted order.
  return "fullsync-checksum-v" + std::to_string(ENCODING_VERSION) + ":" +
         values.dump(-1, ' ', true);
}

uint32_t checksum(const nlohmann::json &values) {
  const std::string encoded = canonicalEncoding(values);
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef *>(encoded.data()),
              static_cast<uInt>(encoded.size()));
  return static_cast<uint32_t>(crc);
}

bool stillValid(const std::map<std::string, uint32_t> &knownSums,
                const std::string &name, uint32_t newSum) {
  auto it = knownSums.find(name);
  return it != knownSums.end() && it->second == newSum;
}

} // namespace ChecksumUtils
