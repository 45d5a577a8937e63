#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "ContentRange.hpp"
#include "UploadEnvironment.hpp"

struct ChunkRequest {
	// Absent or empty starts a new upload
	std::optional<std::string> upload_id;
	std::string filename;
	std::optional<std::string_view> chunk;
	std::optional<std::string> content_range;
};

// Accepts chunks strictly in byte order and appends them to the session's object.
class ChunkAppendProtocol
{
public:
	explicit ChunkAppendProtocol(std::shared_ptr<const UploadEnvironment> env);

public:
	std::tuple<bool, UploadReceipt, UploadError> Append(const ChunkRequest& request, const RequestContext& context);

private:
	std::tuple<bool, UploadSession, UploadError> CreateSession(const ChunkRequest& request, const RequestContext& context) const;
	std::optional<UploadError> CheckSession(const UploadSession& session) const;
	std::tuple<bool, ContentRange, UploadError> ResolveRange(const ChunkRequest& request) const;
	std::optional<UploadError> AppendAndPersist(UploadSession& session, std::string_view chunk, const RequestContext& context, bool is_new) const;
	void RollBack(const UploadSession& session, uint64_t previous, bool is_new) const;

private:
	std::shared_ptr<const UploadEnvironment> env_;
};
