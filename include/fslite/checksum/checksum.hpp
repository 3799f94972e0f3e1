#ifndef FSLITE_CHECKSUM_HPP
#define FSLITE_CHECKSUM_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fslite::checksum {

// Hex length of a SHA-256 digest
static constexpr std::size_t DIGEST_HEX_LENGTH = 64;

class ChecksumError : public std::runtime_error {
public:
  explicit ChecksumError(const std::string& message)
    : std::runtime_error("Checksum error: " + message) {}
};

// ---- FINGERPRINTING ----
// SHA-256 of the given bytes as 64 lowercase hex characters
std::string fingerprint(const uint8_t* data, std::size_t length);
std::string fingerprint(const std::vector<uint8_t>& data);
std::string fingerprint(const std::string& data);

// ---- VALIDATION ----
// True for exactly 64 lowercase hex characters
bool is_valid_digest(const std::string& digest);

} // namespace fslite::checksum

#endif // FSLITE_CHECKSUM_HPP
