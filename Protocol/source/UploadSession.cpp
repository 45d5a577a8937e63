#include "UploadSession.hpp"

#include <ctime>
#include <vector>

#include "fmt/core.h"
#include "openssl/rand.h"

#include "Hasher.hpp"

TimePoint UploadSession::ExpiresAt(std::chrono::seconds window) const noexcept
{
	return created_at + window;
}

bool UploadSession::IsExpired(TimePoint now, std::chrono::seconds window) const noexcept
{
	return ExpiresAt(window) <= now;
}

bool UploadSession::IsComplete() const noexcept
{
	return status == UploadStatus::Complete;
}

bool UploadSession::IsOwnedBy(const std::optional<std::string>& principal) const noexcept
{
	return owner == principal;
}

void UploadSession::Advance(uint64_t bytes) noexcept
{
	offset += bytes;
	cached_checksum.reset();
}

void UploadSession::MarkComplete(TimePoint now) noexcept
{
	status = UploadStatus::Complete;
	completed_at = now;
}

std::string UploadSession::ToString() const
{
	return fmt::format("<{} - upload_id: {} - bytes: {} - status: {}>",
			   display_name, id, offset, static_cast<uint32_t>(status));
}

std::optional<std::string> GenerateUploadId() noexcept
{
	std::vector<uint8_t> bytes(16);
	if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
		return std::nullopt;

	return Hasher::ToHex(bytes);
}

std::string MakeStorageRef(const std::string& prefix, const std::string& id, TimePoint created_at)
{
	const std::time_t t = Clock::to_time_t(created_at);
	std::tm tm{};
	gmtime_r(&t, &tm);

	return fmt::format("{}/{:04}/{:02}/{:02}/{}.part",
			   prefix, tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, id);
}

bool IsWellFormedUploadId(const std::string& id) noexcept
{
	if (id.empty() || id.size() > 64)
		return false;

	for (const char c : id) {
		const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z')
			     || (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
		if (!ok)
			return false;
	}

	return true;
}
