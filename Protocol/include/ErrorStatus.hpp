#pragma once

#include <grpcpp/support/status.h>

#include "UploadError.hpp"

// Carries the error as an UploadErrorDetail in the status' binary details
grpc::Status ToStatus(const UploadError& error);

// Falls back to the gRPC code when the status carries no detail
UploadError FromStatus(const grpc::Status& status);
