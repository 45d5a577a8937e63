#include "UploadError.hpp"

#include <array>
#include <utility>

#include "fmt/core.h"

namespace {
	using Kind = UploadError::Kind;

	const std::array<std::pair<Kind, const char*>, 14> kKindNames = {{
		{ Kind::None,               "None" },
		{ Kind::MissingChunk,       "MissingChunk" },
		{ Kind::MissingRangeHeader, "MissingRangeHeader" },
		{ Kind::MissingParameters,  "MissingParameters" },
		{ Kind::OffsetMismatch,     "OffsetMismatch" },
		{ Kind::SizeMismatch,       "SizeMismatch" },
		{ Kind::SizeLimitExceeded,  "SizeLimitExceeded" },
		{ Kind::AlreadyComplete,    "AlreadyComplete" },
		{ Kind::Expired,            "Expired" },
		{ Kind::ChecksumMismatch,   "ChecksumMismatch" },
		{ Kind::ValidationFailed,   "ValidationFailed" },
		{ Kind::NotFound,           "NotFound" },
		{ Kind::Forbidden,          "Forbidden" },
		{ Kind::StorageFailure,     "StorageFailure" },
	}};
}

int UploadError::HttpStatus() const noexcept
{
	switch (kind) {
	case Kind::None:
		return 200;
	case Kind::NotFound:
		return 404;
	case Kind::Expired:
		return 410;
	case Kind::Forbidden:
		return 403;
	case Kind::StorageFailure:
		return 500;
	default:
		return 400;
	}
}

const char* UploadError::KindName() const noexcept
{
	for (const auto& [k, name] : kKindNames)
		if (k == kind)
			return name;

	return "Unknown";
}

std::string UploadError::ToString() const
{
	if (offset)
		return fmt::format("{} ({}): {} [offset={}]", KindName(), HttpStatus(), detail, *offset);

	return fmt::format("{} ({}): {}", KindName(), HttpStatus(), detail);
}

UploadError UploadError::Make(Kind kind, std::string detail, std::optional<uint64_t> offset)
{
	UploadError error;

	error.kind = kind;
	error.detail = std::move(detail);
	error.offset = offset;

	return error;
}

std::optional<UploadError::Kind> UploadError::KindFromName(std::string_view name) noexcept
{
	for (const auto& [k, kind_name] : kKindNames)
		if (name == kind_name)
			return k;

	return std::nullopt;
}
