#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace vidpipe::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  OffsetConflict carries the server's confirmed offset in the message
  so a client can resynchronise without an extra QueryOffset.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace vidpipe::grpc
