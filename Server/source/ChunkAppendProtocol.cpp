#include "ChunkAppendProtocol.hpp"

#include "fmt/core.h"
#include <spdlog/spdlog.h>

using Kind = UploadError::Kind;

namespace {
	constexpr int kMaxIdAttempts = 8;
}

ChunkAppendProtocol::ChunkAppendProtocol(std::shared_ptr<const UploadEnvironment> env)
	: env_(std::move(env))
{
}

std::tuple<bool, UploadReceipt, UploadError>
ChunkAppendProtocol::Append(const ChunkRequest& request, const RequestContext& context)
{
	if (auto err = env_->CheckPermissions(context))
		return { false, UploadReceipt{}, *err };

	if (!request.chunk)
		return { false, UploadReceipt{}, UploadError::Make(Kind::MissingChunk, "No chunk file was submitted") };

	if (auto err = env_->RunValidation(context))
		return { false, UploadReceipt{}, *err };

	const bool is_new = !request.upload_id || request.upload_id->empty();

	UploadSession session;
	if (is_new) {
		auto [ok, created, err] = CreateSession(request, context);
		if (!ok)
			return { false, UploadReceipt{}, err };

		session = std::move(created);
	}

	// held until the new offset is persisted
	auto guard = env_->locks->Acquire(is_new ? session.id : *request.upload_id);

	if (!is_new) {
		auto [ok, found, err] = env_->Resolve(*request.upload_id, context);
		if (!ok)
			return { false, UploadReceipt{}, err };

		session = std::move(found);
	}

	if (auto err = CheckSession(session))
		return { false, UploadReceipt{}, *err };

	auto [range_ok, range, range_err] = ResolveRange(request);
	if (!range_ok)
		return { false, UploadReceipt{}, range_err };

	const int64_t chunk_size = range.ChunkSize();

	const auto& max_bytes = env_->policy.max_bytes;
	if (max_bytes && range.total >= 0 && static_cast<uint64_t>(range.total) > *max_bytes)
		return { false, UploadReceipt{}, UploadError::Make(Kind::SizeLimitExceeded,
			fmt::format("Size of file exceeds the limit ({} bytes)", *max_bytes)) };

	if (range.start < 0 || static_cast<uint64_t>(range.start) != session.offset) {
		spdlog::debug("upload {}: chunk starts at {}, expected {}", session.id, range.start, session.offset);
		return { false, UploadReceipt{}, UploadError::Make(Kind::OffsetMismatch, "Offsets do not match", session.offset) };
	}

	if (chunk_size < 0 || static_cast<uint64_t>(chunk_size) != request.chunk->size())
		return { false, UploadReceipt{}, UploadError::Make(Kind::SizeMismatch, "File size doesn't match headers") };

	if (auto err = AppendAndPersist(session, *request.chunk, context, is_new))
		return { false, UploadReceipt{}, *err };

	spdlog::debug("upload {}: accepted {} bytes, offset now {}", session.id, chunk_size, session.offset);

	return { true, env_->MakeReceipt(session), UploadError{} };
}

std::tuple<bool, UploadSession, UploadError>
ChunkAppendProtocol::CreateSession(const ChunkRequest& request, const RequestContext& context) const
{
	UploadSession session;

	for (int attempt = 0; attempt < kMaxIdAttempts && session.id.empty(); ++attempt) {
		const auto id = GenerateUploadId();
		if (!id)
			return { false, session, UploadError::Make(Kind::StorageFailure, "failed to generate upload id") };

		const auto [ok, taken, err] = env_->store->Contains(*id);
		if (!ok)
			return { false, session, UploadError::Make(Kind::StorageFailure, "failed to check upload id: " + err.message) };

		if (!taken)
			session.id = *id;
	}

	if (session.id.empty())
		return { false, session, UploadError::Make(Kind::StorageFailure, "failed to allocate a unique upload id") };

	session.created_at = env_->now();
	session.display_name = request.filename;
	session.owner = context.principal;
	session.storage_ref = MakeStorageRef(env_->policy.upload_prefix, session.id, session.created_at);

	return { true, std::move(session), UploadError{} };
}

std::optional<UploadError> ChunkAppendProtocol::CheckSession(const UploadSession& session) const
{
	if (session.IsExpired(env_->now(), env_->policy.expiration_window))
		return UploadError::Make(Kind::Expired, "Upload has expired");

	if (session.IsComplete())
		return UploadError::Make(Kind::AlreadyComplete, "Upload has already been marked as \"complete\"");

	return std::nullopt;
}

std::tuple<bool, ContentRange, UploadError> ChunkAppendProtocol::ResolveRange(const ChunkRequest& request) const
{
	std::optional<ContentRange> range;
	if (request.content_range)
		range = ParseContentRange(*request.content_range);

	if (range)
		return { true, *range, UploadError{} };

	if (env_->policy.fail_if_no_header)
		return { false, ContentRange{}, UploadError::Make(Kind::MissingRangeHeader, "Error in request headers") };

	// clients omit the header when the whole file fits in one chunk
	return { true, ContentRange::WholeFile(request.chunk->size()), UploadError{} };
}

std::optional<UploadError> ChunkAppendProtocol::AppendAndPersist(UploadSession& session,
								 std::string_view chunk,
								 const RequestContext& context,
								 bool is_new) const
{
	const uint64_t previous = session.offset;

	const auto [ok, length, err] = env_->sink->Append(session.storage_ref, chunk, previous);
	if (!ok) {
		spdlog::error("upload {}: append to {} failed: {}", session.id, session.storage_ref, err.message);
		if (is_new)
			RollBack(session, previous, is_new);

		return UploadError::Make(Kind::StorageFailure, "failed to store chunk: " + err.message);
	}

	if (length != previous + chunk.size()) {
		spdlog::error("upload {}: {} holds {} bytes after append, expected {}",
			      session.id, session.storage_ref, length, previous + chunk.size());
		RollBack(session, previous, is_new);

		return UploadError::Make(Kind::StorageFailure, "stored length does not match the upload offset");
	}

	session.Advance(chunk.size());

	if (auto perr = env_->Persist(session, context, is_new)) {
		RollBack(session, previous, is_new);
		session.offset = previous;
		return perr;
	}

	return std::nullopt;
}

void ChunkAppendProtocol::RollBack(const UploadSession& session, uint64_t previous, bool is_new) const
{
	// an object without a record can never be reaped
	if (is_new) {
		if (auto err = env_->sink->Remove(session.storage_ref))
			spdlog::error("upload {}: failed to remove unrecorded {}: {}", session.id, session.storage_ref, err->message);

		return;
	}

	// the object must not run ahead of the persisted offset
	if (auto err = env_->sink->Truncate(session.storage_ref, previous))
		spdlog::error("upload {}: rollback to {} bytes failed: {}", session.id, previous, err->message);
}
