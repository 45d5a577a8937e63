#pragma once

#include <memory>

#include "AppendBlobService.hpp"
#include "BlobSink.hpp"

// Create-once, append-block sink on top of an append blob service.
class AppendBlobSink final : public BlobSink
{
public:
	explicit AppendBlobSink(std::shared_ptr<AppendBlobService> service);

public:
	std::tuple<bool, uint64_t, Error> Append(const std::string& ref, std::string_view data, uint64_t offset) noexcept override;
	std::tuple<bool, std::unique_ptr<BlobReader>, Error> OpenRead(const std::string& ref) noexcept override;
	std::tuple<bool, uint64_t, Error> Size(const std::string& ref) noexcept override;
	std::optional<Error> Truncate(const std::string& ref, uint64_t length) noexcept override;
	std::optional<Error> Remove(const std::string& ref) noexcept override;

	const char* Name() const noexcept override;

private:
	std::optional<Error> Recreate(const std::string& ref) noexcept;

	// Checks the blob ends at offset; a retried chunk whose head is already
	// committed there is accepted, and the committed byte count is returned
	std::tuple<bool, uint64_t, Error> Resume(const std::string& ref, std::string_view data, uint64_t offset) noexcept;

private:
	std::shared_ptr<AppendBlobService> service_;
};
