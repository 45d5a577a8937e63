#include "ContentRange.hpp"

#include <charconv>
#include <limits>

namespace {
	bool ParseNumber(std::string_view text, int64_t& out) noexcept
	{
		if (text.empty())
			return false;

		for (const char c : text)
			if (c < '0' || c > '9')
				return false;

		const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
		return ec == std::errc() && ptr == text.data() + text.size();
	}
}

int64_t ContentRange::ChunkSize() const noexcept
{
	return end - start + 1;
}

ContentRange ContentRange::WholeFile(uint64_t size) noexcept
{
	ContentRange range;

	range.start = 0;
	range.end = static_cast<int64_t>(size) - 1;
	range.total = static_cast<int64_t>(size);

	return range;
}

std::optional<ContentRange> ParseContentRange(std::string_view header) noexcept
{
	constexpr std::string_view kPrefix = "bytes ";
	if (header.substr(0, kPrefix.size()) != kPrefix)
		return std::nullopt;

	header.remove_prefix(kPrefix.size());

	const size_t dash = header.find('-');
	const size_t slash = header.find('/');
	if (dash == std::string_view::npos || slash == std::string_view::npos || slash < dash)
		return std::nullopt;

	ContentRange range;
	if (!ParseNumber(header.substr(0, dash), range.start)
	    || !ParseNumber(header.substr(dash + 1, slash - dash - 1), range.end)
	    || !ParseNumber(header.substr(slash + 1), range.total))
		return std::nullopt;

	// ChunkSize() adds one to end
	if (range.end == std::numeric_limits<int64_t>::max())
		return std::nullopt;

	return range;
}
