#include "ChunkedUploadClient.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "fmt/core.h"
#include <spdlog/spdlog.h>

#include "ErrorStatus.hpp"
#include "FileStream.hpp"
#include "HashingFileStream.hpp"

using Kind = UploadError::Kind;

namespace {
	constexpr const char* kPrincipalKey = "x-upload-principal";

	UploadError LocalError(const std::string& message)
	{
		return UploadError::Make(Kind::StorageFailure, message);
	}
}

ChunkedUploadClient::ChunkedUploadClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(ChunkedUploadService::NewStub(std::move(channel)))
{
}

std::string ChunkedUploadClient::FormatRange(uint64_t start, uint64_t end, uint64_t total)
{
    return fmt::format("bytes {}-{}/{}", start, end, total);
}

void ChunkedUploadClient::Prepare(grpc::ClientContext& context, const Options& options) const
{
    if (options.principal)
        context.AddMetadata(kPrincipalKey, *options.principal);
}

std::tuple<bool, ChunkReceipt, UploadError>
ChunkedUploadClient::SendChunk(const Options& options,
                               const std::optional<std::string>& upload_id,
                               const std::string& filename,
                               std::string_view data,
                               const std::optional<std::string>& content_range)
{
    grpc::ClientContext ctx;
    Prepare(ctx, options);

    AppendChunkRequest req;
    if (upload_id)
        req.set_upload_id(*upload_id);
    req.set_filename(filename);
    req.set_chunk(data.data(), data.size());
    if (content_range)
        req.set_content_range(*content_range);

    ChunkReceipt receipt;
    const grpc::Status st = stub_->AppendChunk(&ctx, req, &receipt);
    if (!st.ok())
        return { false, ChunkReceipt{}, FromStatus(st) };

    return { true, std::move(receipt), UploadError{} };
}

std::tuple<bool, CompleteUploadResponse, UploadError>
ChunkedUploadClient::Complete(const Options& options,
                              const std::string& upload_id,
                              const std::optional<std::string>& checksum)
{
    grpc::ClientContext ctx;
    Prepare(ctx, options);

    CompleteUploadRequest req;
    req.set_upload_id(upload_id);
    if (checksum)
        req.set_checksum(*checksum);

    CompleteUploadResponse resp;
    const grpc::Status st = stub_->CompleteUpload(&ctx, req, &resp);
    if (!st.ok())
        return { false, CompleteUploadResponse{}, FromStatus(st) };

    return { true, std::move(resp), UploadError{} };
}

std::optional<UploadError> ChunkedUploadClient::Delete(const Options& options, const std::string& upload_id)
{
    grpc::ClientContext ctx;
    Prepare(ctx, options);

    DeleteUploadRequest req;
    req.set_upload_id(upload_id);

    DeleteUploadResponse resp;
    const grpc::Status st = stub_->DeleteUpload(&ctx, req, &resp);
    if (!st.ok())
        return FromStatus(st);

    return std::nullopt;
}

std::tuple<bool, uint64_t, UploadError>
ChunkedUploadClient::ProbeOffset(const Options& options, const std::string& upload_id,
                                 const std::string& filename, uint64_t total)
{
    // An empty body declared as one byte at 0 is always rejected: either the
    // offset differs (and is reported) or the size does, meaning offset 0.
    auto [ok, receipt, err] = SendChunk(options, upload_id, filename, "", FormatRange(0, 0, total));
    if (ok)
        return { false, 0, LocalError("server accepted a probe chunk") };

    if (err.kind == Kind::OffsetMismatch && err.offset)
        return { true, *err.offset, UploadError{} };

    if (err.kind == Kind::SizeMismatch)
        return { true, 0, UploadError{} };

    return { false, 0, err };
}

std::tuple<bool, CompleteUploadResponse, UploadError>
ChunkedUploadClient::UploadFile(const std::string& infile, const Options& options)
{
    if (!stub_)
        return { false, CompleteUploadResponse{}, LocalError("stub not initialized") };

    if (infile.empty() || options.chunk_size == 0)
        return { false, CompleteUploadResponse{}, LocalError("infile is empty or chunk size is zero") };

    std::error_code ec;
    const uint64_t total = std::filesystem::file_size(infile, ec);
    if (ec)
        return { false, CompleteUploadResponse{}, LocalError(fmt::format("failed to stat {}: {}", infile, ec.message())) };

    const std::string filename = std::filesystem::path(infile).filename().string();

    std::optional<std::string> checksum;
    if (options.send_checksum) {
        auto [ok, digest, err] = HashingFileStream::DigestFile(infile, options.checksum_type);
        if (!ok)
            return { false, CompleteUploadResponse{}, LocalError("failed to hash infile: " + err.message) };

        if (digest.size != total)
            return { false, CompleteUploadResponse{}, LocalError("infile changed while hashing") };

        checksum = digest.hex;
        spdlog::debug("{} {}: {}", Hasher::TypeName(options.checksum_type), infile, digest.hex);
    }

    std::optional<std::string> upload_id = options.upload_id;
    uint64_t offset = 0;

    if (upload_id) {
        auto [ok, current, err] = ProbeOffset(options, *upload_id, filename, total);
        if (!ok)
            return { false, CompleteUploadResponse{}, err };

        offset = current;
        spdlog::info("resuming upload {} at offset {}", *upload_id, offset);
    }

    if (total == 0 && !upload_id) {
        // no range can describe an empty file
        auto [ok, receipt, err] = SendChunk(options, std::nullopt, filename, "", std::nullopt);
        if (!ok)
            return { false, CompleteUploadResponse{}, err };

        upload_id = receipt.upload_id();
    }

    FileStream stream(infile);
    if (auto err = stream.Open(std::ios::binary | std::ios::in))
        return { false, CompleteUploadResponse{}, LocalError("failed to open infile: " + err->message) };

    std::vector<char> buffer(options.chunk_size);
    int resyncs = 0;

    while (offset < total) {
        if (auto err = stream.Seek(static_cast<std::streamoff>(offset)))
            return { false, CompleteUploadResponse{}, LocalError("failed to seek infile: " + err->message) };

        const uint64_t want = std::min<uint64_t>(options.chunk_size, total - offset);
        const auto [read_ok, len, read_err] = stream.Read(buffer.data(), static_cast<std::streamsize>(want));
        if (!read_ok)
            return { false, CompleteUploadResponse{}, LocalError("failed to read infile: " + read_err.message) };

        if (len <= 0 || static_cast<uint64_t>(len) != want)
            return { false, CompleteUploadResponse{}, LocalError("infile changed while uploading") };

        const std::string_view data(buffer.data(), static_cast<size_t>(len));
        auto [ok, receipt, err] = SendChunk(options, upload_id, filename, data,
                                            FormatRange(offset, offset + want - 1, total));
        if (!ok) {
            if (err.kind == Kind::OffsetMismatch && err.offset && upload_id && ++resyncs <= options.max_resyncs) {
                spdlog::warn("upload {}: server is at offset {}, resending from there", *upload_id, *err.offset);
                offset = *err.offset;
                continue;
            }

            return { false, CompleteUploadResponse{}, err };
        }

        upload_id = receipt.upload_id();
        offset = receipt.offset();
        spdlog::debug("upload {}: {}/{} bytes", *upload_id, offset, total);
    }

    if (auto err = stream.Close())
        return { false, CompleteUploadResponse{}, LocalError("failed to close infile: " + err->message) };

    return Complete(options, *upload_id, checksum);
}
