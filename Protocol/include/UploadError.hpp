#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// A rejected request. Every kind maps to an HTTP-style status a client can act on.
struct UploadError {
	enum class Kind {
		None = 0,
		MissingChunk,
		MissingRangeHeader,
		MissingParameters,
		OffsetMismatch,
		SizeMismatch,
		SizeLimitExceeded,
		AlreadyComplete,
		Expired,
		ChecksumMismatch,
		ValidationFailed,
		NotFound,
		Forbidden,
		StorageFailure
	};

	Kind kind = Kind::None;
	std::string detail;

	// Set for OffsetMismatch so the client can resynchronize
	std::optional<uint64_t> offset;

	int HttpStatus() const noexcept;
	const char* KindName() const noexcept;
	std::string ToString() const;

	static UploadError Make(Kind kind, std::string detail, std::optional<uint64_t> offset = std::nullopt);
	static std::optional<Kind> KindFromName(std::string_view name) noexcept;
};
