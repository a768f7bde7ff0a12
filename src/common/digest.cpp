#include "fsgate/common/digest.hpp"

#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace fsgate::common {

std::string sha256_hex(const std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

} // namespace fsgate::common
