#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "BlobSink.hpp"

// The subset of a cloud blob service needed for append blobs.
class AppendBlobService
{
public:
	using Error = FileStream::Error;

	static constexpr int kNotFound = 404;
	static constexpr int kConflict = 409;

public:
	virtual ~AppendBlobService() = default;

public:
	virtual std::tuple<bool, bool, Error> Exists(const std::string& name) noexcept = 0;
	virtual std::optional<Error> DeleteBlob(const std::string& name) noexcept = 0;
	virtual std::optional<Error> CreateAppendBlob(const std::string& name) noexcept = 0;

	// Returns the committed length of the blob after the block
	virtual std::tuple<bool, uint64_t, Error> AppendBlock(const std::string& name, std::string_view block) noexcept = 0;

	virtual std::tuple<bool, uint64_t, Error> GetSize(const std::string& name) noexcept = 0;
	virtual std::tuple<bool, std::unique_ptr<BlobReader>, Error> Download(const std::string& name) noexcept = 0;

	virtual size_t MaxBlockSize() const noexcept = 0;
};
