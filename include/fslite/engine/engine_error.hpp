#ifndef FSLITE_ENGINE_ERROR_HPP
#define FSLITE_ENGINE_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace fslite::engine {

enum class ErrorKind {
  EMPTY_INPUT,
  NO_NODES_CONFIGURED,
  WRITE_FAILED,
  FRAGMENT_UNAVAILABLE,
  INTEGRITY_VIOLATION,
  STRUCTURAL_CORRUPTION,
  BACKEND_TIMEOUT,
  MESH_DEGRADED,
  FILE_NOT_FOUND
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::EMPTY_INPUT: return "Empty input";
    case ErrorKind::NO_NODES_CONFIGURED: return "No nodes configured";
    case ErrorKind::WRITE_FAILED: return "Write failed";
    case ErrorKind::FRAGMENT_UNAVAILABLE: return "Fragment unavailable";
    case ErrorKind::INTEGRITY_VIOLATION: return "Integrity violation";
    case ErrorKind::STRUCTURAL_CORRUPTION: return "Structural corruption";
    case ErrorKind::BACKEND_TIMEOUT: return "Backend timeout";
    case ErrorKind::MESH_DEGRADED: return "Mesh degraded";
    case ErrorKind::FILE_NOT_FOUND: return "File not found";
    default: return "Undefined error";
  }
}

class EngineError : public std::runtime_error {
public:
  EngineError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message)
    , kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class EmptyInput : public EngineError {
public:
  EmptyInput()
    : EngineError(ErrorKind::EMPTY_INPUT, "content has no bytes to fragment") {}
};

class NoNodesConfigured : public EngineError {
public:
  explicit NoNodesConfigured(const std::string& detail = "node list is empty")
    : EngineError(ErrorKind::NO_NODES_CONFIGURED, detail) {}
};

class WriteFailed : public EngineError {
public:
  WriteFailed(const std::string& node, std::size_t index, const std::string& cause)
    : EngineError(ErrorKind::WRITE_FAILED,
                  "fragment " + std::to_string(index) + " on node " + node + ": " + cause)
    , node_(node)
    , index_(index)
    , cause_(cause) {}

  const std::string& node() const { return node_; }
  std::size_t index() const { return index_; }
  const std::string& cause() const { return cause_; }

private:
  std::string node_;
  std::size_t index_;
  std::string cause_;
};

class FragmentUnavailable : public EngineError {
public:
  FragmentUnavailable(const std::string& node, std::size_t index)
    : EngineError(ErrorKind::FRAGMENT_UNAVAILABLE,
                  "fragment " + std::to_string(index) + " missing on node " + node)
    , node_(node)
    , index_(index) {}

  const std::string& node() const { return node_; }
  std::size_t index() const { return index_; }

private:
  std::string node_;
  std::size_t index_;
};

class IntegrityViolation : public EngineError {
public:
  explicit IntegrityViolation(std::size_t index)
    : EngineError(ErrorKind::INTEGRITY_VIOLATION,
                  "checksum mismatch in fragment " + std::to_string(index))
    , index_(index) {}

  std::size_t index() const { return index_; }

private:
  std::size_t index_;
};

class StructuralCorruption : public EngineError {
public:
  explicit StructuralCorruption(const std::string& reason)
    : EngineError(ErrorKind::STRUCTURAL_CORRUPTION, reason)
    , reason_(reason) {}

  const std::string& reason() const { return reason_; }

private:
  std::string reason_;
};

class BackendTimeout : public EngineError {
public:
  BackendTimeout(const std::string& node, std::size_t index)
    : EngineError(ErrorKind::BACKEND_TIMEOUT,
                  "node " + node + " did not answer for fragment " + std::to_string(index))
    , node_(node)
    , index_(index) {}

  const std::string& node() const { return node_; }
  std::size_t index() const { return index_; }

private:
  std::string node_;
  std::size_t index_;
};

// Raised by the full-mesh policy before any I/O starts
class MeshDegraded : public EngineError {
public:
  explicit MeshDegraded(const std::vector<std::string>& offline)
    : EngineError(ErrorKind::MESH_DEGRADED, "offline nodes: " + join(offline))
    , offline_(offline) {}

  const std::vector<std::string>& offline_nodes() const { return offline_; }

private:
  std::vector<std::string> offline_;

  static std::string join(const std::vector<std::string>& names) {
    std::string result;
    for (const auto& name : names) {
      if (!result.empty()) {
        result += ", ";
      }
      result += name;
    }
    return result;
  }
};

class FileNotFound : public EngineError {
public:
  explicit FileNotFound(const std::string& file_id)
    : EngineError(ErrorKind::FILE_NOT_FOUND, "no file with id " + file_id)
    , file_id_(file_id) {}

  const std::string& file_id() const { return file_id_; }

private:
  std::string file_id_;
};

} // namespace fslite::engine

#endif // FSLITE_ENGINE_ERROR_HPP
