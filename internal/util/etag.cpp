#include "etag.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace twingraph::util {

Digest Md5(std::string_view input) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize MD5");
  }
  if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
    throw std::runtime_error("Failed to update MD5");
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
  unsigned int                               hash_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1 || hash_len < 16) {
    throw std::runtime_error("Failed to finalize MD5");
  }

  Digest digest{};
  for (size_t i = 0; i < digest.size(); ++i) {
    digest[i] = hash[i];
  }
  return digest;
}

std::string FormatGuid(const Digest& bytes) {
  static constexpr int kOrder[16] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};

  std::ostringstream oss;
  for (size_t i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[kOrder[i]]);
  }
  return oss.str();
}

std::string GenerateEtag(std::string_view entity_id, TimePoint last_update_time) {
  std::string input(entity_id);
  input += "-";
  input += ToIso8601(last_update_time);
  return "W/\"" + FormatGuid(Md5(input)) + "\"";
}

std::string NextEtag(std::string_view entity_id, TimePoint& write_time, std::string_view previous) {
  auto etag = GenerateEtag(entity_id, write_time);
  while (etag == previous) {
    write_time += std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(100));
    etag = GenerateEtag(entity_id, write_time);
  }
  return etag;
}

} // namespace twingraph::util
