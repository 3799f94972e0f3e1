#include "fslite/checksum/checksum.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>

namespace fslite::checksum {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw ChecksumError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace

//==============================================
// FINGERPRINTING
//==============================================

std::string fingerprint(const uint8_t* data, std::size_t length) {
  if (!data && length > 0) {
    throw ChecksumError("Null buffer with non-zero length");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw ChecksumError("Failed to initialize hash context");
  }

  if (length > 0 && !EVP_DigestUpdate(context.get(), data, length)) {
    throw ChecksumError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    throw ChecksumError("Failed to finalize hash");
  }

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string fingerprint(const std::vector<uint8_t>& data) {
  return fingerprint(data.data(), data.size());
}

std::string fingerprint(const std::string& data) {
  return fingerprint(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

//==============================================
// VALIDATION
//==============================================

bool is_valid_digest(const std::string& digest) {
  if (digest.size() != DIGEST_HEX_LENGTH) {
    return false;
  }
  for (char c : digest) {
    bool hex_digit = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex_digit) {
      return false;
    }
  }
  return true;
}

} // namespace fslite::checksum
