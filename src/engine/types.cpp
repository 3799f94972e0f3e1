#include "fslite/engine/types.hpp"
#include "fslite/engine/engine_error.hpp"
#include "fslite/checksum/checksum.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fslite::engine {

//==============================================
// FRAGMENT AND FILE RECORD
//==============================================

Fragment::Fragment(std::size_t index, std::string node, std::string name,
                   std::string hash, std::size_t size)
  : index(index)
  , node(std::move(node))
  , name(std::move(name))
  , hash(std::move(hash))
  , size(size) {

  if (this->node.empty()) {
    throw std::invalid_argument("Fragment: Empty node for fragment " + std::to_string(index));
  }
  if (this->name.empty()) {
    throw std::invalid_argument("Fragment: Empty name for fragment " + std::to_string(index));
  }
  if (!checksum::is_valid_digest(this->hash)) {
    throw std::invalid_argument("Fragment: Malformed hash for fragment " + std::to_string(index));
  }
  if (size == 0) {
    throw std::invalid_argument("Fragment: Zero size for fragment " + std::to_string(index));
  }
}

bool Fragment::operator==(const Fragment& other) const {
  return index == other.index && node == other.node && name == other.name &&
         hash == other.hash && size == other.size;
}

FileRecord::FileRecord(std::string id, std::string filename, std::vector<Fragment> fragments)
  : id(std::move(id))
  , filename(std::move(filename))
  , fragments(sort_and_validate(std::move(fragments))) {

  if (this->id.empty()) {
    throw std::invalid_argument("File record: Empty file id");
  }
}

std::size_t FileRecord::total_size() const {
  return std::accumulate(fragments.begin(), fragments.end(), std::size_t{0},
    [](std::size_t total, const Fragment& fragment) { return total + fragment.size; });
}


//==============================================
// POLICIES
//==============================================

std::size_t SizingPolicy::fragment_size(std::size_t content_size) const {
  if (value == 0) {
    throw std::invalid_argument(mode == Mode::FIXED_SIZE
      ? "Sizing policy: Fragment size must be positive"
      : "Sizing policy: Fragment count must be positive");
  }

  if (mode == Mode::FIXED_SIZE) {
    return value;
  }

  // ceil(content_size / count), at least one byte
  std::size_t size = content_size / value + (content_size % value != 0 ? 1 : 0);
  return std::max<std::size_t>(size, 1);
}

const char* to_string(AvailabilityPolicy policy) {
  switch (policy) {
    case AvailabilityPolicy::IGNORE: return "ignore";
    case AvailabilityPolicy::FULL_MESH: return "full-mesh";
    case AvailabilityPolicy::AVAILABLE_ONLY: return "available-only";
    default: return "unknown";
  }
}

AvailabilityPolicy parse_availability_policy(const std::string& name) {
  if (name == "ignore") return AvailabilityPolicy::IGNORE;
  if (name == "full-mesh") return AvailabilityPolicy::FULL_MESH;
  if (name == "available-only") return AvailabilityPolicy::AVAILABLE_ONLY;
  throw std::invalid_argument("Unknown availability policy: " + name);
}


//==============================================
// NAMING
//==============================================

std::string make_blob_name(const std::string& file_id, std::size_t index) {
  return file_id + ".part" + std::to_string(index);
}

std::string generate_file_id() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("Failed to generate random file id");
  }

  std::stringstream ss;
  for (unsigned char byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}


//==============================================
// STRUCTURAL VALIDATION
//==============================================

std::vector<Fragment> sort_and_validate(std::vector<Fragment> fragments) {
  if (fragments.empty()) {
    throw StructuralCorruption("fragment list is empty");
  }

  std::stable_sort(fragments.begin(), fragments.end(),
    [](const Fragment& a, const Fragment& b) { return a.index < b.index; });

  for (std::size_t expected = 0; expected < fragments.size(); ++expected) {
    std::size_t actual = fragments[expected].index;
    if (actual == expected) {
      continue;
    }
    if (expected > 0 && actual == fragments[expected - 1].index) {
      throw StructuralCorruption("duplicate fragment index " + std::to_string(actual));
    }
    throw StructuralCorruption("missing fragment index " + std::to_string(expected));
  }

  return fragments;
}

} // namespace fslite::engine
