#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

class FileStream {
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	explicit FileStream(const std::filesystem::path& path);
	virtual ~FileStream() = default;

public:
	const std::filesystem::path& GetPath() const noexcept;
	bool IsOpen() const noexcept;

public:
	virtual std::optional<Error> Open(std::ios::openmode mode) noexcept;
	virtual std::optional<Error> Write(std::string_view data) noexcept;
	virtual std::optional<Error> Flush() noexcept;

	virtual std::tuple<bool, std::streamsize, Error> Read(std::string& data) noexcept;
	virtual std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept;

	// Repositions the read cursor, for resuming from a server-reported offset
	virtual std::optional<Error> Seek(std::streamoff offset) noexcept;

	virtual std::optional<Error> Close() noexcept;

public:
	// Both work on the file by path, whether or not the stream is open
	std::tuple<bool, uint64_t, Error> Size() const noexcept;
	std::optional<Error> Resize(uint64_t length) noexcept;

private:
	Error stream_error(const std::ios& stream, const char* context) const noexcept;
	Error fs_error(const std::error_code& ec, const char* context) const;

private:
	const std::filesystem::path path_;
	std::fstream stream_;
};
