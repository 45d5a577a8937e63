#include "CompletionProtocol.hpp"

#include <cstdio>
#include <exception>
#include <vector>

#include "fmt/core.h"
#include <spdlog/spdlog.h>

#include "Hasher.hpp"

using Kind = UploadError::Kind;

CompletionProtocol::CompletionProtocol(std::shared_ptr<const UploadEnvironment> env)
	: env_(std::move(env))
{
}

std::optional<UploadError> CompletionProtocol::CheckRequest(const CompletionRequest& request) const
{
	if (env_->policy.verify_checksum) {
		if (request.upload_id.empty() || !request.checksum || request.checksum->empty())
			return UploadError::Make(Kind::MissingParameters, "Both 'upload_id' and 'checksum' are required");
	} else if (request.upload_id.empty()) {
		return UploadError::Make(Kind::MissingParameters, "'upload_id' is required");
	}

	return std::nullopt;
}

std::tuple<bool, CompletionResult, UploadError>
CompletionProtocol::Complete(const CompletionRequest& request, const RequestContext& context)
{
	if (auto err = env_->CheckPermissions(context))
		return { false, CompletionResult{}, *err };

	if (auto err = CheckRequest(request))
		return { false, CompletionResult{}, *err };

	std::optional<SessionLockTable::Guard> guard(env_->locks->Acquire(request.upload_id));

	auto [ok, session, err] = env_->Resolve(request.upload_id, context);
	if (!ok)
		return { false, CompletionResult{}, err };

	if (auto verr = env_->RunValidation(context))
		return { false, CompletionResult{}, *verr };

	if (session.IsComplete())
		return { false, CompletionResult{}, UploadError::Make(Kind::AlreadyComplete, "Upload has already been marked as complete") };

	if (session.IsExpired(env_->now(), env_->policy.expiration_window))
		return { false, CompletionResult{}, UploadError::Make(Kind::Expired, "Upload has expired") };

	if (env_->policy.verify_checksum)
		if (auto cerr = VerifyChecksum(session, *request.checksum))
			return { false, CompletionResult{}, *cerr };

	// the object must be readable before the session is marked complete
	auto [opened, reader, rerr] = env_->sink->OpenRead(session.storage_ref);
	if (!opened) {
		spdlog::error("upload {}: failed to open {}: {}", session.id, session.storage_ref, rerr.message);
		return { false, CompletionResult{}, UploadError::Make(Kind::StorageFailure, "failed to open upload: " + rerr.message) };
	}

	session.MarkComplete(env_->now());
	if (auto perr = env_->Persist(session, context, false))
		return { false, CompletionResult{}, *perr };

	spdlog::info("upload {} complete: {} ({} bytes)", session.id, session.display_name, session.offset);

	// the hook may move or delete the upload, which takes the session lock again
	guard.reset();

	UploadedFile file{ session.display_name, session.offset, session.storage_ref, std::move(reader) };
	NotifyCompletion(file, context);

	CompletionResult result;
	result.receipt = env_->MakeReceipt(session);
	result.status = session.status;
	result.completed_at = *session.completed_at;
	result.size = session.offset;
	result.filename = session.display_name;

	return { true, std::move(result), UploadError{} };
}

std::optional<UploadError> CompletionProtocol::VerifyChecksum(UploadSession& session, const std::string& expected) const
{
	auto [ok, actual, err] = Checksum(session);
	if (!ok)
		return err;

	const auto expected_bytes = Hasher::FromHex(expected);
	const auto actual_bytes = Hasher::FromHex(actual);

	if (!expected_bytes || !actual_bytes || *expected_bytes != *actual_bytes) {
		spdlog::warn("upload {}: checksum mismatch, client sent {}, object has {}", session.id, expected, actual);
		return UploadError::Make(Kind::ChecksumMismatch,
			fmt::format("{} checksum does not match", Hasher::TypeName(env_->policy.checksum_type)));
	}

	return std::nullopt;
}

std::tuple<bool, std::string, UploadError> CompletionProtocol::Checksum(UploadSession& session) const noexcept
{
	if (session.cached_checksum)
		return { true, *session.cached_checksum, UploadError{} };

	auto storage_failure = [&session](const std::string& what) {
		spdlog::error("upload {}: checksum failed: {}", session.id, what);
		return UploadError::Make(Kind::StorageFailure, "failed to compute checksum: " + what);
	};

	auto [opened, reader, rerr] = env_->sink->OpenRead(session.storage_ref);
	if (!opened)
		return { false, "", storage_failure(rerr.message) };

	Hasher hasher(env_->policy.checksum_type);
	if (auto herr = hasher.Initialize())
		return { false, "", storage_failure(herr->message) };

	std::vector<char> buffer(64 * BUFSIZ);
	while (true) {
		const auto [ok, n, err] = reader->Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		if (!ok)
			return { false, "", storage_failure(err.message) };

		if (n <= 0)
			break;

		if (auto herr = hasher.Update(buffer.data(), static_cast<size_t>(n)))
			return { false, "", storage_failure(herr->message) };
	}

	auto [finalized, digest, ferr] = hasher.Finalize();
	if (!finalized)
		return { false, "", storage_failure(ferr.message) };

	session.cached_checksum = Hasher::ToHex(digest);

	return { true, *session.cached_checksum, UploadError{} };
}

void CompletionProtocol::NotifyCompletion(UploadedFile& file, const RequestContext& context) const
{
	if (!env_->hooks.on_completion)
		return;

	// hook failures do not undo completion
	try {
		env_->hooks.on_completion(file, context);
	} catch (const std::exception& e) {
		spdlog::error("completion hook for {} failed: {}", file.storage_ref, e.what());
	}
}
