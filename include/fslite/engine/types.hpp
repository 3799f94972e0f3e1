#ifndef FSLITE_ENGINE_TYPES_HPP
#define FSLITE_ENGINE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fslite::engine {

// One hashed, immutable slice of a file stored on one node.
// The constructor rejects empty node/name, malformed hashes and zero sizes.
struct Fragment {
  std::size_t index;
  std::string node;
  std::string name;
  std::string hash;
  std::size_t size;

  Fragment(std::size_t index, std::string node, std::string name,
           std::string hash, std::size_t size);

  bool operator==(const Fragment& other) const;
  bool operator!=(const Fragment& other) const { return !(*this == other); }
};

// A file's identity plus its fragments, sorted by index.
// Construction throws StructuralCorruption for a non-contiguous index set.
struct FileRecord {
  std::string id;
  std::string filename;
  std::vector<Fragment> fragments;

  FileRecord(std::string id, std::string filename, std::vector<Fragment> fragments);

  std::size_t total_size() const;
};

// ---- SIZING POLICY ----
struct SizingPolicy {
  enum class Mode {
    FIXED_SIZE,
    FIXED_COUNT
  };

  Mode mode;
  // Bytes per fragment for FIXED_SIZE, target fragment count for FIXED_COUNT
  std::size_t value;

  static SizingPolicy fixed_size(std::size_t bytes) { return {Mode::FIXED_SIZE, bytes}; }
  static SizingPolicy fixed_count(std::size_t count) { return {Mode::FIXED_COUNT, count}; }

  // Byte length of every fragment but the last. Throws std::invalid_argument for a zero value.
  std::size_t fragment_size(std::size_t content_size) const;
};

// ---- AVAILABILITY POLICY ----
// How node availability flags gate placement and I/O
enum class AvailabilityPolicy {
  // Round-robin over all nodes; I/O against an offline node fails for that fragment
  IGNORE,
  // Round-robin over all nodes; any offline node blocks the whole operation
  FULL_MESH,
  // Round-robin over the nodes online when the split starts
  AVAILABLE_ONLY
};

const char* to_string(AvailabilityPolicy policy);
// Accepts "ignore", "full-mesh" and "available-only". Throws std::invalid_argument otherwise.
AvailabilityPolicy parse_availability_policy(const std::string& name);

// ---- LAYOUT ----
// Byte range and destination of one fragment, computed before any I/O
struct PlannedFragment {
  std::size_t index;
  std::size_t offset;
  std::size_t length;
  std::string node;
  std::string name;
};

// Storage key of a fragment: "<file_id>.part<index>"
std::string make_blob_name(const std::string& file_id, std::size_t index);

// 16 random bytes from the OpenSSL generator, hex encoded
std::string generate_file_id();

// Sorts by index and checks the indices are exactly 0..N-1 with N >= 1.
// Throws StructuralCorruption naming the first problem found.
std::vector<Fragment> sort_and_validate(std::vector<Fragment> fragments);

} // namespace fslite::engine

#endif // FSLITE_ENGINE_TYPES_HPP
