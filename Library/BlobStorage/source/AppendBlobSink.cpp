#include "AppendBlobSink.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "fmt/core.h"

AppendBlobSink::AppendBlobSink(std::shared_ptr<AppendBlobService> service)
	: service_(std::move(service))
{
}

std::optional<AppendBlobSink::Error> AppendBlobSink::Recreate(const std::string& ref) noexcept
{
	const auto [ok, exists, err] = service_->Exists(ref);
	if (!ok)
		return err;

	// a stale object may not even be an append blob
	if (exists)
		if (auto derr = service_->DeleteBlob(ref))
			return derr;

	return service_->CreateAppendBlob(ref);
}

std::tuple<bool, uint64_t, AppendBlobSink::Error>
AppendBlobSink::Resume(const std::string& ref, std::string_view data, uint64_t offset) noexcept
{
	const auto [ok, size, err] = service_->GetSize(ref);
	if (!ok)
		return { false, 0, err };

	if (size == offset)
		return { true, 0, Error{} };

	const Error conflict{ AppendBlobService::kConflict,
		fmt::format("append position mismatch: {} holds {} bytes, expected {}", ref, size, offset) };

	// only a committed prefix of this very chunk may sit past offset
	if (size < offset || size - offset > data.size())
		return { false, 0, conflict };

	auto [opened, reader, rerr] = service_->Download(ref);
	if (!opened)
		return { false, 0, rerr };

	std::string blob;
	std::vector<char> buffer(64 * 1024);
	while (blob.size() < size) {
		const auto [read_ok, n, read_err] = reader->Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		if (!read_ok)
			return { false, 0, read_err };

		if (n <= 0)
			break;

		blob.append(buffer.data(), static_cast<size_t>(n));
	}

	const size_t committed = static_cast<size_t>(size - offset);
	if (blob.size() != size || std::string_view(blob).substr(static_cast<size_t>(offset)) != data.substr(0, committed))
		return { false, 0, conflict };

	return { true, committed, Error{} };
}

std::tuple<bool, uint64_t, AppendBlobSink::Error>
AppendBlobSink::Append(const std::string& ref, std::string_view data, uint64_t offset) noexcept
{
	if (!service_)
		return { false, 0, Error{ -1, "append blob service is not configured" } };

	uint64_t length = offset;
	if (offset == 0) {
		if (auto err = Recreate(ref))
			return { false, 0, *err };
	} else {
		const auto [ok, committed, err] = Resume(ref, data, offset);
		if (!ok)
			return { false, 0, err };

		data.remove_prefix(static_cast<size_t>(committed));
		length += committed;
	}

	if (data.empty())
		return { true, length, Error{} };

	const size_t block_size = std::max<size_t>(service_->MaxBlockSize(), 1);

	for (size_t pos = 0; pos < data.size(); pos += block_size) {
		const auto [ok, committed, err] = service_->AppendBlock(ref, data.substr(pos, block_size));
		if (!ok) {
			Error out = err;
			if (pos != 0)
				out.message = fmt::format("{} (after {} of {} bytes were committed)", err.message, pos, data.size());

			return { false, 0, out };
		}

		length = committed;
	}

	return { true, length, Error{} };
}

std::tuple<bool, std::unique_ptr<BlobReader>, AppendBlobSink::Error>
AppendBlobSink::OpenRead(const std::string& ref) noexcept
{
	if (!service_)
		return { false, nullptr, Error{ -1, "append blob service is not configured" } };

	return service_->Download(ref);
}

std::tuple<bool, uint64_t, AppendBlobSink::Error> AppendBlobSink::Size(const std::string& ref) noexcept
{
	if (!service_)
		return { false, 0, Error{ -1, "append blob service is not configured" } };

	return service_->GetSize(ref);
}

std::optional<AppendBlobSink::Error> AppendBlobSink::Truncate(const std::string& ref, uint64_t length) noexcept
{
	return Error{ -1, fmt::format("append blob {} cannot be truncated to {} bytes", ref, length) };
}

std::optional<AppendBlobSink::Error> AppendBlobSink::Remove(const std::string& ref) noexcept
{
	if (!service_)
		return Error{ -1, "append blob service is not configured" };

	if (auto err = service_->DeleteBlob(ref)) {
		if (err->code == AppendBlobService::kNotFound)
			return std::nullopt;

		return err;
	}

	return std::nullopt;
}

const char* AppendBlobSink::Name() const noexcept
{
	return "append-blob";
}
