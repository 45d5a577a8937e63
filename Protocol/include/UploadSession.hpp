#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Values beyond Complete are free for callers (e.g. failed or aborted uploads)
enum class UploadStatus : uint32_t {
	Uploading = 1,
	Complete = 2
};

struct UploadSession {
	std::string id;
	std::string storage_ref;
	std::string display_name;
	uint64_t offset = 0;

	TimePoint created_at;
	std::optional<TimePoint> completed_at;

	UploadStatus status = UploadStatus::Uploading;
	std::optional<std::string> owner;

	// Digest of the backing object, valid only for the current offset
	std::optional<std::string> cached_checksum;

	TimePoint ExpiresAt(std::chrono::seconds window) const noexcept;
	bool IsExpired(TimePoint now, std::chrono::seconds window) const noexcept;
	bool IsComplete() const noexcept;
	bool IsOwnedBy(const std::optional<std::string>& principal) const noexcept;

	void Advance(uint64_t bytes) noexcept;
	void MarkComplete(TimePoint now) noexcept;

	std::string ToString() const;
};

// 32 hex characters from the OpenSSL CSPRNG
std::optional<std::string> GenerateUploadId() noexcept;

// <prefix>/<YYYY>/<MM>/<DD>/<id>.part, dated in UTC
std::string MakeStorageRef(const std::string& prefix, const std::string& id, TimePoint created_at);

bool IsWellFormedUploadId(const std::string& id) noexcept;
