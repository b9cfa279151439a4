#include "rpc_status.h"

namespace chunkpost {

grpc::Status toGrpcStatus(const Status& status) {
    grpc::StatusCode code = grpc::StatusCode::UNKNOWN;
    switch (status.code()) {
        case ErrorCode::kOk:
            return grpc::Status::OK;
        case ErrorCode::kBadRequest:
        case ErrorCode::kIntegrityError:
        case ErrorCode::kConflict:
        case ErrorCode::kPathEscape:
            code = grpc::StatusCode::INVALID_ARGUMENT;
            break;
        case ErrorCode::kUnauthorized:
            code = grpc::StatusCode::UNAUTHENTICATED;
            break;
        case ErrorCode::kUnknownSession:
        case ErrorCode::kNotFound:
            code = grpc::StatusCode::NOT_FOUND;
            break;
        case ErrorCode::kIncompleteUpload:
            code = grpc::StatusCode::FAILED_PRECONDITION;
            break;
        case ErrorCode::kPayloadTooLarge:
            code = grpc::StatusCode::RESOURCE_EXHAUSTED;
            break;
        case ErrorCode::kStorageError:
        case ErrorCode::kConfigError:
            code = grpc::StatusCode::INTERNAL;
            break;
        case ErrorCode::kTimeout:
            code = grpc::StatusCode::DEADLINE_EXCEEDED;
            break;
        case ErrorCode::kTransportError:
        case ErrorCode::kRefused:
            code = grpc::StatusCode::UNAVAILABLE;
            break;
    }
    // The taxonomy name travels in the details so clients can map it back exactly
    return grpc::Status(code, status.message(), Status::errorCodeName(status.code()));
}

Status fromGrpcStatus(const grpc::Status& status) {
    if (status.ok()) {
        return Status::OK();
    }
    if (!status.error_details().empty()) {
        return Status(Status::errorCodeFromName(status.error_details()), status.error_message());
    }

    switch (status.error_code()) {
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return Status(ErrorCode::kTimeout, status.error_message());
        case grpc::StatusCode::UNAVAILABLE:
            return Status(ErrorCode::kTransportError, status.error_message());
        case grpc::StatusCode::INVALID_ARGUMENT:
            return Status(ErrorCode::kBadRequest, status.error_message());
        case grpc::StatusCode::UNAUTHENTICATED:
            return Status(ErrorCode::kUnauthorized, status.error_message());
        case grpc::StatusCode::NOT_FOUND:
            return Status(ErrorCode::kUnknownSession, status.error_message());
        case grpc::StatusCode::FAILED_PRECONDITION:
            return Status(ErrorCode::kIncompleteUpload, status.error_message());
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            return Status(ErrorCode::kPayloadTooLarge, status.error_message());
        case grpc::StatusCode::INTERNAL:
            return Status(ErrorCode::kStorageError, status.error_message());
        default:
            return Status(ErrorCode::kTransportError, status.error_message());
    }
}

} // namespace chunkpost
