#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace alib {

using Digest = std::array<uint8_t, 32>;

std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const Digest& d);

Digest sha256(std::string_view bytes);
Digest sha256_pair(const Digest& left, const Digest& right);
std::string sha256_hex(std::string_view bytes);

// Incremental SHA-256 over OpenSSL EVP.
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(std::string_view bytes);
  Digest finish();

private:
  void* ctx_; // EVP_MD_CTX*
};

// Cryptographically random bytes.
std::string random_bytes(size_t n);

} // namespace alib
