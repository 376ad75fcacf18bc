#include "trellis/random-id.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "trellis/log.hpp"

namespace trellis {

std::string RandomUuid() {
  std::array<unsigned char, 16> bytes;
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    const auto err = ERR_get_error();
    char errBuf[256];
    ERR_error_string_n(err, errBuf, sizeof(errBuf));
    log::error("RAND_bytes failed: {}", errBuf);
    throw std::runtime_error("Unable to generate random identifier");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);  // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);  // RFC 4122 variant

  static constexpr char kHex[] = "0123456789abcdef";
  std::string uuid;
  uuid.reserve(36);
  for (std::size_t pos = 0; pos < bytes.size(); ++pos) {
    if (pos == 4 || pos == 6 || pos == 8 || pos == 10) {
      uuid.push_back('-');
    }
    uuid.push_back(kHex[bytes[pos] >> 4U]);
    uuid.push_back(kHex[bytes[pos] & 0x0FU]);
  }
  return uuid;
}

}  // namespace trellis
