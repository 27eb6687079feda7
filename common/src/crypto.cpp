#include "common/crypto.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace livequiz {

namespace {
std::string to_hex(const std::vector<unsigned char>& bytes) {
  static const char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}
}  // namespace

std::string random_hex_id(std::size_t bytes) {
  std::vector<unsigned char> buf(bytes);
  if (bytes > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    char err[256];
    ERR_error_string_n(ERR_get_error(), err, sizeof(err));
    throw std::runtime_error(std::string("RAND_bytes failed: ") + err);
  }
  return to_hex(buf);
}

std::string new_message_id() {
  return "M-" + random_hex_id(6);
}

}  // namespace livequiz
