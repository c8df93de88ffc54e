#include "base64.hpp"

#include <openssl/evp.h>

#include <vector>

#include "internal/util/errors.hpp"

namespace twingraph::util {

std::string Base64Encode(std::string_view data) {
  if (data.empty()) {
    return {};
  }

  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int                        n =
      EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size()));
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
}

std::string Base64Decode(std::string_view encoded) {
  if (encoded.empty()) {
    return {};
  }
  if (encoded.size() % 4 != 0) {
    throw InvalidArgument("invalid base64 length");
  }

  std::vector<unsigned char> out((encoded.size() * 3) / 4 + 4);
  int                        n = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(encoded.data()), static_cast<int>(encoded.size()));
  if (n < 0) {
    throw InvalidArgument("invalid base64");
  }
  out.resize(static_cast<size_t>(n));

  size_t pad = 0;
  if (encoded.back() == '=') pad++;
  if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') pad++;
  out.resize(out.size() - pad);

  return std::string(out.begin(), out.end());
}

} // namespace twingraph::util
