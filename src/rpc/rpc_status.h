#pragma once

#include "status.h"
#include <grpcpp/grpcpp.h>

namespace chunkpost {

// Trailing metadata key carrying the missing chunk indices of an incomplete upload
constexpr const char* kMissingChunksMetadata = "x-missing-chunks";

grpc::Status toGrpcStatus(const Status& status);
Status fromGrpcStatus(const grpc::Status& status);

} // namespace chunkpost
