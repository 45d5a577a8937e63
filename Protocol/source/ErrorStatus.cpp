#include "ErrorStatus.hpp"

#include "upload_service.pb.h"

namespace {
	grpc::StatusCode MapStatusCode(const UploadError& error) noexcept
	{
		if (error.kind == UploadError::Kind::ChecksumMismatch)
			return grpc::StatusCode::DATA_LOSS;

		switch (error.HttpStatus()) {
		case 200: return grpc::StatusCode::OK;
		case 403: return grpc::StatusCode::PERMISSION_DENIED;
		case 404: return grpc::StatusCode::NOT_FOUND;
		case 410: return grpc::StatusCode::FAILED_PRECONDITION;
		case 500: return grpc::StatusCode::INTERNAL;
		default:  return grpc::StatusCode::INVALID_ARGUMENT;
		}
	}

	UploadError::Kind KindFromCode(grpc::StatusCode code) noexcept
	{
		switch (code) {
		case grpc::StatusCode::OK:                  return UploadError::Kind::None;
		case grpc::StatusCode::PERMISSION_DENIED:
		case grpc::StatusCode::UNAUTHENTICATED:     return UploadError::Kind::Forbidden;
		case grpc::StatusCode::NOT_FOUND:           return UploadError::Kind::NotFound;
		case grpc::StatusCode::FAILED_PRECONDITION: return UploadError::Kind::Expired;
		case grpc::StatusCode::DATA_LOSS:           return UploadError::Kind::ChecksumMismatch;
		case grpc::StatusCode::INVALID_ARGUMENT:    return UploadError::Kind::ValidationFailed;
		default:                                    return UploadError::Kind::StorageFailure;
		}
	}
}

grpc::Status ToStatus(const UploadError& error)
{
	if (error.kind == UploadError::Kind::None)
		return grpc::Status::OK;

	UploadErrorDetail detail;
	detail.set_kind(error.KindName());
	detail.set_http_status(static_cast<uint32_t>(error.HttpStatus()));
	detail.set_detail(error.detail);
	if (error.offset)
		detail.set_offset(*error.offset);

	return grpc::Status(MapStatusCode(error), error.detail, detail.SerializeAsString());
}

UploadError FromStatus(const grpc::Status& status)
{
	if (status.ok())
		return UploadError{};

	UploadErrorDetail detail;
	if (!status.error_details().empty() && detail.ParseFromString(status.error_details())) {
		const auto kind = UploadError::KindFromName(detail.kind());
		if (kind) {
			std::optional<uint64_t> offset;
			if (detail.has_offset())
				offset = detail.offset();

			return UploadError::Make(*kind, detail.detail(), offset);
		}
	}

	return UploadError::Make(KindFromCode(status.error_code()), status.error_message());
}
