#include "MemoryAppendBlobService.hpp"

#include <algorithm>
#include <cstring>

namespace {
	class MemoryBlobReader final : public BlobReader
	{
	public:
		explicit MemoryBlobReader(std::string data)
			: data_(std::move(data)) { }

	public:
		std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept override
		{
			if (size < 0)
				return { false, 0, Error{ -1, "read: invalid size" } };

			if (size > 0 && !data)
				return { false, 0, Error{ -1, "read: null buffer with non-zero size" } };

			const size_t n = std::min(static_cast<size_t>(size), data_.size() - position_);
			std::memcpy(data, data_.data() + position_, n);
			position_ += n;

			return { true, static_cast<std::streamsize>(n), Error{} };
		}

	private:
		const std::string data_;
		size_t position_ = 0;
	};

	AppendBlobService::Error NotFound(const std::string& name)
	{
		return AppendBlobService::Error{ AppendBlobService::kNotFound, "blob not found: " + name };
	}
}

MemoryAppendBlobService::MemoryAppendBlobService(size_t max_block_size)
	: max_block_size_(max_block_size)
{
}

std::tuple<bool, bool, MemoryAppendBlobService::Error> MemoryAppendBlobService::Exists(const std::string& name) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	return { true, blobs_.count(name) != 0, Error{} };
}

std::optional<MemoryAppendBlobService::Error> MemoryAppendBlobService::DeleteBlob(const std::string& name) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (blobs_.erase(name) == 0)
		return NotFound(name);

	return std::nullopt;
}

std::optional<MemoryAppendBlobService::Error> MemoryAppendBlobService::CreateAppendBlob(const std::string& name) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	blobs_[name].clear();

	return std::nullopt;
}

std::tuple<bool, uint64_t, MemoryAppendBlobService::Error>
MemoryAppendBlobService::AppendBlock(const std::string& name, std::string_view block) noexcept
{
	if (block.size() > max_block_size_)
		return { false, 0, Error{ kConflict, "block exceeds the maximum append block size" } };

	std::lock_guard<std::mutex> lock(mutex_);
	auto it = blobs_.find(name);
	if (it == blobs_.end())
		return { false, 0, NotFound(name) };

	it->second.append(block.data(), block.size());
	++appends_;

	return { true, it->second.size(), Error{} };
}

std::tuple<bool, uint64_t, MemoryAppendBlobService::Error> MemoryAppendBlobService::GetSize(const std::string& name) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = blobs_.find(name);
	if (it == blobs_.end())
		return { false, 0, NotFound(name) };

	return { true, it->second.size(), Error{} };
}

std::tuple<bool, std::unique_ptr<BlobReader>, MemoryAppendBlobService::Error>
MemoryAppendBlobService::Download(const std::string& name) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = blobs_.find(name);
	if (it == blobs_.end())
		return { false, nullptr, NotFound(name) };

	return { true, std::make_unique<MemoryBlobReader>(it->second), Error{} };
}

size_t MemoryAppendBlobService::MaxBlockSize() const noexcept
{
	return max_block_size_;
}

size_t MemoryAppendBlobService::BlobCount() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return blobs_.size();
}

size_t MemoryAppendBlobService::AppendCount() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return appends_;
}
