#pragma once

#include <map>
#include <mutex>

#include "SessionStore.hpp"

class MemorySessionStore final : public SessionStore
{
public:
	std::tuple<bool, std::optional<UploadSession>, Error> Load(const std::string& id) noexcept override;
	std::tuple<bool, bool, Error> Contains(const std::string& id) noexcept override;
	std::optional<Error> Save(const UploadSession& session) noexcept override;
	std::optional<Error> Remove(const std::string& id) noexcept override;
	std::tuple<bool, std::vector<UploadSession>, Error> List() noexcept override;

private:
	std::mutex mutex_;
	std::map<std::string, UploadSession> sessions_;
};
