#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

// "bytes {start}-{end}/{total}", end inclusive and 0-indexed
struct ContentRange {
	int64_t start = 0;
	int64_t end = -1;
	int64_t total = 0;

	int64_t ChunkSize() const noexcept;

	// Describes a request that carries the entire file
	static ContentRange WholeFile(uint64_t size) noexcept;
};

// Yields nothing for anything that is not an exact match of the form
std::optional<ContentRange> ParseContentRange(std::string_view header) noexcept;
