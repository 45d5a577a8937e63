#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "AppendBlobService.hpp"
#include "BlobSink.hpp"
#include "Hasher.hpp"

enum class StorageBackend {
	Local,
	AppendBlob
};

struct UploadPolicy {
	// Largest declared total accepted; empty means unlimited
	std::optional<uint64_t> max_bytes;
	std::chrono::seconds expiration_window = std::chrono::hours(24);

	// When false, a chunk without a range header is taken as the whole file
	bool fail_if_no_header = false;
	bool verify_checksum = true;
	Hasher::Type checksum_type = Hasher::Type::MD5;

	StorageBackend storage_backend = StorageBackend::Local;
	bool require_authentication = false;
	std::string upload_prefix = "chunked_uploads";

	std::string ToString() const;
};

std::optional<StorageBackend> StorageBackendFromName(std::string_view name) noexcept;
const char* StorageBackendName(StorageBackend backend) noexcept;

// Unsigned decimal with no sign or whitespace; empty on anything else or on overflow
std::optional<uint64_t> ParseCount(std::string_view text) noexcept;
std::optional<std::chrono::seconds> ParseSeconds(std::string_view text) noexcept;

// Picks the sink implementation named by policy.storage_backend
std::tuple<bool, std::shared_ptr<BlobSink>, std::string>
CreateBlobSink(const UploadPolicy& policy,
	       const std::filesystem::path& root_dir,
	       std::shared_ptr<AppendBlobService> append_blob_service);
