#pragma once

#include <map>
#include <mutex>

#include "AppendBlobService.hpp"

// Process-local append blob container, for development and tests.
class MemoryAppendBlobService final : public AppendBlobService
{
public:
	static constexpr size_t kDefaultMaxBlockSize = 4 * 1024 * 1024;

public:
	explicit MemoryAppendBlobService(size_t max_block_size = kDefaultMaxBlockSize);

public:
	std::tuple<bool, bool, Error> Exists(const std::string& name) noexcept override;
	std::optional<Error> DeleteBlob(const std::string& name) noexcept override;
	std::optional<Error> CreateAppendBlob(const std::string& name) noexcept override;
	std::tuple<bool, uint64_t, Error> AppendBlock(const std::string& name, std::string_view block) noexcept override;
	std::tuple<bool, uint64_t, Error> GetSize(const std::string& name) noexcept override;
	std::tuple<bool, std::unique_ptr<BlobReader>, Error> Download(const std::string& name) noexcept override;

	size_t MaxBlockSize() const noexcept override;

public:
	size_t BlobCount() const;
	size_t AppendCount() const;

private:
	const size_t max_block_size_;

	mutable std::mutex mutex_;
	std::map<std::string, std::string> blobs_;
	size_t appends_ = 0;
};
