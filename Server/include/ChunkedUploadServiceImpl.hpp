#pragma once

#include "upload_service.grpc.pb.h"
#include "upload_service.pb.h"

#include <memory>

#include "ChunkAppendProtocol.hpp"
#include "CompletionProtocol.hpp"
#include "SessionReaper.hpp"
#include "UploadEnvironment.hpp"

class ChunkedUploadServiceImpl final : public ChunkedUploadService::Service
{
public:
	static constexpr const char* kPrincipalKey = "x-upload-principal";

public:
	ChunkedUploadServiceImpl(std::shared_ptr<const UploadEnvironment> env, std::shared_ptr<SessionReaper> reaper);

private:
	grpc::Status AppendChunk(grpc::ServerContext* context, const AppendChunkRequest* request, ChunkReceipt* response) override;
	grpc::Status CompleteUpload(grpc::ServerContext* context, const CompleteUploadRequest* request, CompleteUploadResponse* response) override;
	grpc::Status DeleteUpload(grpc::ServerContext* context, const DeleteUploadRequest* request, DeleteUploadResponse* response) override;

private:
	static RequestContext MakeRequestContext(const grpc::ServerContext* context);

private:
	ChunkAppendProtocol append_;
	CompletionProtocol completion_;
	std::shared_ptr<SessionReaper> reaper_;
};
