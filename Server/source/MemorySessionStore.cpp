#include "MemorySessionStore.hpp"

std::tuple<bool, std::optional<UploadSession>, MemorySessionStore::Error>
MemorySessionStore::Load(const std::string& id) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = sessions_.find(id);
	if (it == sessions_.end())
		return { true, std::nullopt, Error{} };

	UploadSession session = it->second;
	session.cached_checksum.reset();

	return { true, std::move(session), Error{} };
}

std::tuple<bool, bool, MemorySessionStore::Error> MemorySessionStore::Contains(const std::string& id) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	return { true, sessions_.count(id) != 0, Error{} };
}

std::optional<MemorySessionStore::Error> MemorySessionStore::Save(const UploadSession& session) noexcept
{
	if (session.id.empty())
		return Error{ -1, "session has no upload id" };

	std::lock_guard<std::mutex> lock(mutex_);
	sessions_[session.id] = session;

	return std::nullopt;
}

std::optional<MemorySessionStore::Error> MemorySessionStore::Remove(const std::string& id) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	sessions_.erase(id);

	return std::nullopt;
}

std::tuple<bool, std::vector<UploadSession>, MemorySessionStore::Error> MemorySessionStore::List() noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);

	std::vector<UploadSession> out;
	out.reserve(sessions_.size());
	for (const auto& [id, session] : sessions_)
		out.push_back(session);

	return { true, std::move(out), Error{} };
}
