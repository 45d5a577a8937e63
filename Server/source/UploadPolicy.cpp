#include "UploadPolicy.hpp"

#include <charconv>
#include <limits>

#include "fmt/core.h"

#include "AppendBlobSink.hpp"
#include "LocalFileSink.hpp"

std::string UploadPolicy::ToString() const
{
	return fmt::format("max_bytes={} expiration={}s fail_if_no_header={} verify_checksum={} checksum={} storage={} require_auth={} prefix={}",
			   max_bytes ? std::to_string(*max_bytes) : "unlimited",
			   expiration_window.count(),
			   fail_if_no_header,
			   verify_checksum,
			   Hasher::TypeName(checksum_type),
			   StorageBackendName(storage_backend),
			   require_authentication,
			   upload_prefix);
}

std::optional<StorageBackend> StorageBackendFromName(std::string_view name) noexcept
{
	if (name == "local")       return StorageBackend::Local;
	if (name == "append-blob") return StorageBackend::AppendBlob;

	return std::nullopt;
}

const char* StorageBackendName(StorageBackend backend) noexcept
{
	switch (backend) {
	case StorageBackend::Local:      return "local";
	case StorageBackend::AppendBlob: return "append-blob";
	}

	return "unknown";
}

std::optional<uint64_t> ParseCount(std::string_view text) noexcept
{
	if (text.empty())
		return std::nullopt;

	for (const char c : text)
		if (c < '0' || c > '9')
			return std::nullopt;

	uint64_t value = 0;
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc() || ptr != text.data() + text.size())
		return std::nullopt;

	return value;
}

std::optional<std::chrono::seconds> ParseSeconds(std::string_view text) noexcept
{
	const auto count = ParseCount(text);
	if (!count || *count > static_cast<uint64_t>(std::numeric_limits<std::chrono::seconds::rep>::max()))
		return std::nullopt;

	return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(*count));
}

std::tuple<bool, std::shared_ptr<BlobSink>, std::string>
CreateBlobSink(const UploadPolicy& policy,
	       const std::filesystem::path& root_dir,
	       std::shared_ptr<AppendBlobService> append_blob_service)
{
	switch (policy.storage_backend) {
	case StorageBackend::Local: {
		auto sink = std::make_shared<LocalFileSink>(root_dir);
		if (!sink->IsValid())
			return { false, nullptr, fmt::format("invalid root directory {}", root_dir.string()) };

		return { true, std::move(sink), "" };
	}

	case StorageBackend::AppendBlob:
		if (!append_blob_service)
			return { false, nullptr, "append-blob storage requires an append blob service" };

		return { true, std::make_shared<AppendBlobSink>(std::move(append_blob_service)), "" };
	}

	return { false, nullptr, "unknown storage backend" };
}
