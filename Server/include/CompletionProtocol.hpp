#pragma once

#include <memory>
#include <optional>
#include <string>
#include <tuple>

#include "UploadEnvironment.hpp"

struct CompletionRequest {
	std::string upload_id;
	std::optional<std::string> checksum;
};

struct CompletionResult {
	UploadReceipt receipt;
	UploadStatus status = UploadStatus::Uploading;
	TimePoint completed_at;
	uint64_t size = 0;
	std::string filename;
};

// Verifies the assembled object and marks its session complete.
class CompletionProtocol
{
public:
	explicit CompletionProtocol(std::shared_ptr<const UploadEnvironment> env);

public:
	std::tuple<bool, CompletionResult, UploadError> Complete(const CompletionRequest& request, const RequestContext& context);

	/**
	 * Hex digest of the whole backing object in a single streaming pass.
	 * Cached on the session until its offset moves.
	 */
	std::tuple<bool, std::string, UploadError> Checksum(UploadSession& session) const noexcept;

private:
	std::optional<UploadError> CheckRequest(const CompletionRequest& request) const;
	std::optional<UploadError> VerifyChecksum(UploadSession& session, const std::string& expected) const;
	void NotifyCompletion(UploadedFile& file, const RequestContext& context) const;

private:
	std::shared_ptr<const UploadEnvironment> env_;
};
