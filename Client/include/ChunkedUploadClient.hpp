#pragma once

#include "upload_service.grpc.pb.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include <grpcpp/grpcpp.h>

#include "upload_service.pb.h"

#include "Hasher.hpp"
#include "UploadError.hpp"

class ChunkedUploadClient
{
public:
	struct Options {
		size_t chunk_size = 1024 * 1024;
		std::optional<std::string> principal;

		// Continue this upload instead of starting a new one
		std::optional<std::string> upload_id;

		bool send_checksum = true;
		Hasher::Type checksum_type = Hasher::Type::MD5;

		// How often the client may jump to a server-reported offset
		int max_resyncs = 8;
	};

public:
	explicit ChunkedUploadClient(std::shared_ptr<grpc::Channel> channel);

public:
	std::tuple<bool, CompleteUploadResponse, UploadError> UploadFile(const std::string& infile, const Options& options);

	std::tuple<bool, ChunkReceipt, UploadError> SendChunk(const Options& options,
							     const std::optional<std::string>& upload_id,
							     const std::string& filename,
							     std::string_view data,
							     const std::optional<std::string>& content_range);

	std::tuple<bool, CompleteUploadResponse, UploadError> Complete(const Options& options,
								      const std::string& upload_id,
								      const std::optional<std::string>& checksum);

	std::optional<UploadError> Delete(const Options& options, const std::string& upload_id);

public:
	static std::string FormatRange(uint64_t start, uint64_t end, uint64_t total);

private:
	std::tuple<bool, uint64_t, UploadError> ProbeOffset(const Options& options, const std::string& upload_id,
							   const std::string& filename, uint64_t total);

	void Prepare(grpc::ClientContext& context, const Options& options) const;

private:
	std::unique_ptr<ChunkedUploadService::Stub> stub_;
};
