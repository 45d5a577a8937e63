#include "ChunkedUploadServiceImpl.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "ErrorStatus.hpp"
#include "SessionRecord.hpp"

namespace {
	void FillReceipt(const UploadReceipt& from, ChunkReceipt* to)
	{
		to->set_upload_id(from.upload_id);
		to->set_offset(from.offset);
		*to->mutable_expires() = ToTimestamp(from.expires);
	}

	UploadState MapState(UploadStatus status)
	{
		switch (status) {
		case UploadStatus::Uploading: return UPLOAD_STATE_UPLOADING;
		case UploadStatus::Complete:  return UPLOAD_STATE_COMPLETE;
		}

		return UPLOAD_STATE_UNSPECIFIED;
	}

	grpc::Status Reject(const char* method, const RequestContext& ctx, const UploadError& error)
	{
		if (error.kind == UploadError::Kind::StorageFailure)
			spdlog::error("{} from {}: {}", method, ctx.peer, error.ToString());
		else
			spdlog::warn("{} from {}: {}", method, ctx.peer, error.ToString());

		return ToStatus(error);
	}
}

ChunkedUploadServiceImpl::ChunkedUploadServiceImpl(std::shared_ptr<const UploadEnvironment> env,
						   std::shared_ptr<SessionReaper> reaper)
	: append_(env)
	, completion_(env)
	, reaper_(std::move(reaper))
{
}

RequestContext ChunkedUploadServiceImpl::MakeRequestContext(const grpc::ServerContext* context)
{
	RequestContext ctx;
	if (!context)
		return ctx;

	ctx.peer = context->peer();

	const auto& metadata = context->client_metadata();
	auto it = metadata.find(kPrincipalKey);
	if (it != metadata.end() && it->second.length() != 0)
		ctx.principal = std::string(it->second.data(), it->second.length());

	return ctx;
}

grpc::Status ChunkedUploadServiceImpl::AppendChunk(grpc::ServerContext* context,
						   const AppendChunkRequest* request,
						   ChunkReceipt* response)
{
	const RequestContext ctx = MakeRequestContext(context);

	ChunkRequest chunk;
	if (request->has_upload_id())
		chunk.upload_id = request->upload_id();
	chunk.filename = request->filename();
	if (request->has_chunk())
		chunk.chunk = std::string_view(request->chunk());
	if (request->has_content_range())
		chunk.content_range = request->content_range();

	auto [ok, receipt, err] = append_.Append(chunk, ctx);
	if (!ok)
		return Reject("AppendChunk", ctx, err);

	FillReceipt(receipt, response);

	return grpc::Status::OK;
}

grpc::Status ChunkedUploadServiceImpl::CompleteUpload(grpc::ServerContext* context,
						      const CompleteUploadRequest* request,
						      CompleteUploadResponse* response)
{
	const RequestContext ctx = MakeRequestContext(context);

	CompletionRequest completion;
	completion.upload_id = request->upload_id();
	if (request->has_checksum())
		completion.checksum = request->checksum();

	auto [ok, result, err] = completion_.Complete(completion, ctx);
	if (!ok)
		return Reject("CompleteUpload", ctx, err);

	FillReceipt(result.receipt, response->mutable_receipt());
	response->set_status(MapState(result.status));
	*response->mutable_completed() = ToTimestamp(result.completed_at);
	response->set_size(result.size);
	response->set_filename(result.filename);

	return grpc::Status::OK;
}

grpc::Status ChunkedUploadServiceImpl::DeleteUpload(grpc::ServerContext* context,
						    const DeleteUploadRequest* request,
						    DeleteUploadResponse* response)
{
	const RequestContext ctx = MakeRequestContext(context);

	if (auto err = reaper_->Delete(request->upload_id(), ctx))
		return Reject("DeleteUpload", ctx, *err);

	return grpc::Status::OK;
}
