#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "FileStream.hpp"

class BlobReader
{
public:
	using Error = FileStream::Error;

public:
	virtual ~BlobReader() = default;

public:
	// Returns 0 bytes once the end of the object is reached
	virtual std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept = 0;
};

// Appends bytes to named objects. Each object belongs to exactly one upload.
class BlobSink
{
public:
	using Error = FileStream::Error;

public:
	virtual ~BlobSink() = default;

public:
	/**
	 * Appends data to ref and returns the object's resulting length.
	 * An offset of zero marks the first append of an upload: ref is reset to a
	 * clean, zero-length object before the data is written. Failed appends are
	 * never retried here.
	 */
	virtual std::tuple<bool, uint64_t, Error> Append(const std::string& ref, std::string_view data, uint64_t offset) noexcept = 0;

	virtual std::tuple<bool, std::unique_ptr<BlobReader>, Error> OpenRead(const std::string& ref) noexcept = 0;
	virtual std::tuple<bool, uint64_t, Error> Size(const std::string& ref) noexcept = 0;

	// Cuts ref back to length; used to undo an append whose session could not be saved
	virtual std::optional<Error> Truncate(const std::string& ref, uint64_t length) noexcept = 0;

	// Removing an object that does not exist succeeds
	virtual std::optional<Error> Remove(const std::string& ref) noexcept = 0;

	virtual const char* Name() const noexcept = 0;
};
