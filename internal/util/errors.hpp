#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vidpipe::util {

/*
  Central error types.

  These get translated later to gRPC status codes, and the worker
  pool uses them to decide between retry, fail-fast and abandon.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Contract violation: stage invoked out of order, missing ids, illegal transition.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Scratch disk full, transcoder killed for memory.
class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Size mismatch, empty or corrupt payload, unsupported container. Never retried.
class DataIntegrity : public std::runtime_error {
 public:
  explicit DataIntegrity(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Network blip, object store timeout. Retried with backoff.
class TransientIo : public std::runtime_error {
 public:
  explicit TransientIo(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Chunk offset does not match the server-confirmed offset.
class OffsetConflict : public std::runtime_error {
 public:
  OffsetConflict(const std::string& msg, std::uint64_t confirmed_offset)
      : std::runtime_error(msg + " (confirmed offset " + std::to_string(confirmed_offset) + ")"), confirmed_offset_(confirmed_offset) {
  }

  std::uint64_t ConfirmedOffset() const {
    return confirmed_offset_;
  }

 private:
  std::uint64_t confirmed_offset_;
};

} // namespace vidpipe::util
