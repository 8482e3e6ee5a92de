#include "internal/db/api/result.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"

namespace vidpipe::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, std::string_view what) {
  if (result) {
    return;
  }

  std::string message = std::string(what) + ": " + ToString(result.code);
  if (!result.message.empty()) {
    message += " (" + result.message + ")";
  }

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case ErrorCode::Busy:
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw TransactionConflict(message);
    case ErrorCode::IOError:
      throw util::TransientIo(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace vidpipe::db
