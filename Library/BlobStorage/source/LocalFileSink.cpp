#include "LocalFileSink.hpp"

#include <system_error>

#include "fmt/core.h"
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {
	class LocalBlobReader final : public BlobReader
	{
	public:
		explicit LocalBlobReader(const fs::path& path)
			: file_(path) { }

	public:
		std::optional<Error> Open() noexcept
		{
			return file_.Open(std::ios::binary | std::ios::in);
		}

		std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept override
		{
			return file_.Read(data, size);
		}

	private:
		FileStream file_;
	};

	BlobSink::Error FromErrorCode(const std::error_code& ec, const std::string& what)
	{
		return BlobSink::Error{ ec.value(), what + ": " + ec.message() };
	}
}

LocalFileSink::LocalFileSink(const fs::path& root_dir)
	: root_dir_(root_dir)
{
}

bool LocalFileSink::IsValid() const noexcept
{
	std::error_code ec;
	return !root_dir_.empty()
		&& fs::exists(root_dir_, ec)
		&& fs::is_directory(root_dir_, ec);
}

fs::path LocalFileSink::Resolve(const std::string& ref) const
{
	return root_dir_ / ref;
}

std::optional<LocalFileSink::Error> LocalFileSink::CheckRef(const std::string& ref) const noexcept
{
	if (ref.empty())
		return Error{ -1, "empty storage reference" };

	const fs::path path(ref);
	if (path.is_absolute())
		return Error{ -1, "storage reference must be relative: " + ref };

	for (const auto& part : path)
		if (part == "..")
			return Error{ -1, "storage reference escapes the root directory: " + ref };

	return std::nullopt;
}

std::tuple<bool, uint64_t, LocalFileSink::Error>
LocalFileSink::Append(const std::string& ref, std::string_view data, uint64_t offset) noexcept
{
	if (auto err = CheckRef(ref))
		return { false, 0, *err };

	const fs::path path = Resolve(ref);
	std::error_code ec;

	fs::create_directories(path.parent_path(), ec);
	if (ec)
		return { false, 0, FromErrorCode(ec, "create_directories " + path.parent_path().string()) };

	FileStream file(path);

	std::ios::openmode mode = std::ios::binary | std::ios::out;
	if (offset == 0) {
		mode |= std::ios::trunc;
	} else {
		const auto [ok, current, err] = file.Size();
		if (!ok)
			return { false, 0, err };

		if (current < offset)
			return { false, current, Error{ -1, fmt::format("backing file holds {} bytes, expected {}", current, offset) } };

		// bytes past offset were never credited to the upload
		if (current > offset) {
			spdlog::warn("discarding {} uncredited bytes from {}", current - offset, path.string());
			if (auto rerr = file.Resize(offset))
				return { false, 0, *rerr };
		}

		mode |= std::ios::app;
	}

	if (auto err = file.Open(mode))
		return { false, 0, *err };

	auto err = file.Write(data);
	if (!err)
		err = file.Flush();

	if (err) {
		(void)file.Close();
		if (auto rerr = file.Resize(offset))
			spdlog::error("failed to roll back {} to {} bytes: {}", path.string(), offset, rerr->message);

		return { false, 0, *err };
	}

	if (auto cerr = file.Close())
		return { false, 0, *cerr };

	return file.Size();
}

std::tuple<bool, std::unique_ptr<BlobReader>, LocalFileSink::Error>
LocalFileSink::OpenRead(const std::string& ref) noexcept
{
	if (auto err = CheckRef(ref))
		return { false, nullptr, *err };

	auto reader = std::make_unique<LocalBlobReader>(Resolve(ref));
	if (auto err = reader->Open())
		return { false, nullptr, *err };

	return { true, std::move(reader), Error{} };
}

std::tuple<bool, uint64_t, LocalFileSink::Error> LocalFileSink::Size(const std::string& ref) noexcept
{
	if (auto err = CheckRef(ref))
		return { false, 0, *err };

	return FileStream(Resolve(ref)).Size();
}

std::optional<LocalFileSink::Error> LocalFileSink::Truncate(const std::string& ref, uint64_t length) noexcept
{
	if (auto err = CheckRef(ref))
		return err;

	return FileStream(Resolve(ref)).Resize(length);
}

std::optional<LocalFileSink::Error> LocalFileSink::Remove(const std::string& ref) noexcept
{
	if (auto err = CheckRef(ref))
		return err;

	std::error_code ec;
	fs::remove(Resolve(ref), ec);
	if (ec)
		return FromErrorCode(ec, "remove " + ref);

	return std::nullopt;
}

const char* LocalFileSink::Name() const noexcept
{
	return "local";
}
