#pragma once

#include <filesystem>

#include "BlobSink.hpp"

// Stores every object as a file below a root directory, opened in append mode per chunk.
class LocalFileSink final : public BlobSink
{
public:
	explicit LocalFileSink(const std::filesystem::path& root_dir);

public:
	bool IsValid() const noexcept;
	std::filesystem::path Resolve(const std::string& ref) const;

public:
	std::tuple<bool, uint64_t, Error> Append(const std::string& ref, std::string_view data, uint64_t offset) noexcept override;
	std::tuple<bool, std::unique_ptr<BlobReader>, Error> OpenRead(const std::string& ref) noexcept override;
	std::tuple<bool, uint64_t, Error> Size(const std::string& ref) noexcept override;
	std::optional<Error> Truncate(const std::string& ref, uint64_t length) noexcept override;
	std::optional<Error> Remove(const std::string& ref) noexcept override;

	const char* Name() const noexcept override;

private:
	std::optional<Error> CheckRef(const std::string& ref) const noexcept;

private:
	const std::filesystem::path root_dir_;
};
