#include "FileSessionStore.hpp"

#include <cstdio>
#include <system_error>

#include <spdlog/spdlog.h>

#include "FileStream.hpp"
#include "SessionRecord.hpp"

namespace fs = std::filesystem;

namespace {
	SessionStore::Error FromStreamError(const FileStream::Error& e)
	{
		return SessionStore::Error{ e.code, e.message };
	}

	SessionStore::Error FromErrorCode(const std::error_code& ec, const std::string& what)
	{
		return SessionStore::Error{ ec.value(), what + ": " + ec.message() };
	}
}

FileSessionStore::FileSessionStore(const fs::path& directory)
	: directory_(directory)
{
}

bool FileSessionStore::IsValid() const noexcept
{
	std::error_code ec;
	return !directory_.empty()
		&& fs::exists(directory_, ec)
		&& fs::is_directory(directory_, ec);
}

fs::path FileSessionStore::PathFor(const std::string& id) const
{
	return directory_ / (id + kExtension);
}

std::tuple<bool, std::optional<UploadSession>, FileSessionStore::Error>
FileSessionStore::ReadRecord(const fs::path& path) noexcept
{
	std::error_code ec;
	if (!fs::exists(path, ec))
		return { true, std::nullopt, Error{} };

	FileStream file(path);
	if (auto err = file.Open(std::ios::binary | std::ios::in))
		return { false, std::nullopt, FromStreamError(*err) };

	std::string contents;
	std::string buffer(BUFSIZ, '\0');
	while (true) {
		const auto [ok, n, err] = file.Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		if (!ok) {
			(void)file.Close();
			return { false, std::nullopt, FromStreamError(err) };
		}

		if (n <= 0)
			break;

		contents.append(buffer.data(), static_cast<size_t>(n));
	}

	if (auto err = file.Close())
		return { false, std::nullopt, FromStreamError(*err) };

	UploadSessionRecord record;
	if (!record.ParseFromString(contents))
		return { false, std::nullopt, Error{ -1, "corrupt session record: " + path.string() } };

	return { true, FromRecord(record), Error{} };
}

std::tuple<bool, std::optional<UploadSession>, FileSessionStore::Error>
FileSessionStore::Load(const std::string& id) noexcept
{
	// ids arrive from clients and become file names
	if (!IsWellFormedUploadId(id))
		return { true, std::nullopt, Error{} };

	std::lock_guard<std::mutex> lock(mutex_);
	return ReadRecord(PathFor(id));
}

std::tuple<bool, bool, FileSessionStore::Error> FileSessionStore::Contains(const std::string& id) noexcept
{
	if (!IsWellFormedUploadId(id))
		return { true, false, Error{} };

	std::lock_guard<std::mutex> lock(mutex_);

	std::error_code ec;
	const bool exists = fs::exists(PathFor(id), ec);
	if (ec)
		return { false, false, FromErrorCode(ec, "exists " + id) };

	return { true, exists, Error{} };
}

std::optional<FileSessionStore::Error> FileSessionStore::Save(const UploadSession& session) noexcept
{
	if (!IsWellFormedUploadId(session.id))
		return Error{ -1, "malformed upload id: " + session.id };

	std::string payload;
	if (!ToRecord(session).SerializeToString(&payload))
		return Error{ -1, "failed to serialize session " + session.id };

	std::lock_guard<std::mutex> lock(mutex_);

	const fs::path target = PathFor(session.id);
	fs::path temp = target;
	temp += ".tmp";

	FileStream file(temp);
	if (auto err = file.Open(std::ios::binary | std::ios::out | std::ios::trunc))
		return FromStreamError(*err);

	auto err = file.Write(payload);
	if (!err)
		err = file.Flush();

	if (auto cerr = file.Close(); cerr && !err)
		err = cerr;

	std::error_code ec;
	if (err) {
		fs::remove(temp, ec);
		return FromStreamError(*err);
	}

	fs::rename(temp, target, ec);
	if (ec) {
		const Error out = FromErrorCode(ec, "rename " + temp.string());
		fs::remove(temp, ec);
		return out;
	}

	return std::nullopt;
}

std::optional<FileSessionStore::Error> FileSessionStore::Remove(const std::string& id) noexcept
{
	if (!IsWellFormedUploadId(id))
		return std::nullopt;

	std::lock_guard<std::mutex> lock(mutex_);

	std::error_code ec;
	fs::remove(PathFor(id), ec);
	if (ec)
		return FromErrorCode(ec, "remove " + id);

	return std::nullopt;
}

std::tuple<bool, std::vector<UploadSession>, FileSessionStore::Error> FileSessionStore::List() noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);

	std::vector<UploadSession> out;
	std::error_code ec;

	for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
		const fs::path& path = it->path();
		if (path.extension() != kExtension)
			continue;

		auto [ok, session, err] = ReadRecord(path);
		if (!ok) {
			spdlog::warn("skipping unreadable session record {}: {}", path.string(), err.message);
			continue;
		}

		if (session)
			out.push_back(std::move(*session));
	}

	if (ec)
		return { false, {}, FromErrorCode(ec, "list " + directory_.string()) };

	return { true, std::move(out), Error{} };
}
