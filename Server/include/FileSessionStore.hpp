#pragma once

#include <filesystem>
#include <mutex>

#include "SessionStore.hpp"

// One serialized UploadSessionRecord per session, written atomically via rename.
class FileSessionStore final : public SessionStore
{
public:
	explicit FileSessionStore(const std::filesystem::path& directory);

public:
	bool IsValid() const noexcept;

public:
	std::tuple<bool, std::optional<UploadSession>, Error> Load(const std::string& id) noexcept override;
	std::tuple<bool, bool, Error> Contains(const std::string& id) noexcept override;
	std::optional<Error> Save(const UploadSession& session) noexcept override;
	std::optional<Error> Remove(const std::string& id) noexcept override;
	std::tuple<bool, std::vector<UploadSession>, Error> List() noexcept override;

private:
	std::filesystem::path PathFor(const std::string& id) const;
	std::tuple<bool, std::optional<UploadSession>, Error> ReadRecord(const std::filesystem::path& path) noexcept;

private:
	static constexpr const char* kExtension = ".session";

	const std::filesystem::path directory_;
	std::mutex mutex_;
};
