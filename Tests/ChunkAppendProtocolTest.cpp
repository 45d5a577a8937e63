#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <random>
#include <thread>
#include <vector>

#include "ChunkAppendProtocol.hpp"
#include "ChunkedUploadClient.hpp"
#include "LocalFileSink.hpp"
#include "MemorySessionStore.hpp"

#include "TestSupport.hpp"

using Kind = UploadError::Kind;

namespace {
	ChunkRequest MakeChunk(std::optional<std::string> upload_id, std::string_view chunk,
			       std::optional<std::string> range = std::nullopt)
	{
		ChunkRequest request;
		request.upload_id = std::move(upload_id);
		request.filename = "data.bin";
		request.chunk = chunk;
		request.content_range = std::move(range);

		return request;
	}

	std::string Range(uint64_t start, uint64_t end, uint64_t total)
	{
		return ChunkedUploadClient::FormatRange(start, end, total);
	}

	class FailingSink final : public BlobSink
	{
	public:
		explicit FailingSink(std::shared_ptr<BlobSink> inner)
			: inner_(std::move(inner)) { }

		std::tuple<bool, uint64_t, Error> Append(const std::string& ref, std::string_view data, uint64_t offset) noexcept override
		{
			++appends;
			if (fail_append)
				return { false, 0, Error{ -1, "disk full" } };

			auto [ok, length, err] = inner_->Append(ref, data, offset);
			if (ok && short_write)
				return { true, length - 1, Error{} };

			return { ok, length, err };
		}

		std::tuple<bool, std::unique_ptr<BlobReader>, Error> OpenRead(const std::string& ref) noexcept override
		{
			return inner_->OpenRead(ref);
		}

		std::tuple<bool, uint64_t, Error> Size(const std::string& ref) noexcept override
		{
			return inner_->Size(ref);
		}

		std::optional<Error> Truncate(const std::string& ref, uint64_t length) noexcept override
		{
			++truncates;
			return inner_->Truncate(ref, length);
		}

		std::optional<Error> Remove(const std::string& ref) noexcept override
		{
			return inner_->Remove(ref);
		}

		const char* Name() const noexcept override
		{
			return "failing";
		}

		bool fail_append = false;
		bool short_write = false;
		int appends = 0;
		int truncates = 0;

	private:
		std::shared_ptr<BlobSink> inner_;
	};

	class FailingStore final : public SessionStore
	{
	public:
		std::tuple<bool, std::optional<UploadSession>, Error> Load(const std::string& id) noexcept override
		{
			return inner_.Load(id);
		}

		std::tuple<bool, bool, Error> Contains(const std::string& id) noexcept override
		{
			return inner_.Contains(id);
		}

		std::optional<Error> Save(const UploadSession& session) noexcept override
		{
			if (failing_saves > 0) {
				--failing_saves;
				return Error{ -1, "database unavailable" };
			}

			return inner_.Save(session);
		}

		std::optional<Error> Remove(const std::string& id) noexcept override
		{
			return inner_.Remove(id);
		}

		std::tuple<bool, std::vector<UploadSession>, Error> List() noexcept override
		{
			return inner_.List();
		}

		int failing_saves = 0;

	private:
		MemorySessionStore inner_;
	};
}

class ChunkAppendProtocolTest : public ::testing::Test
{
protected:
	void Configure(const UploadPolicy& policy)
	{
		test_ = MakeMemoryEnvironment(policy);
		protocol_ = std::make_unique<ChunkAppendProtocol>(test_.env);
	}

	void SetUp() override
	{
		Configure(UploadPolicy{});
	}

	UploadSession Stored(const std::string& id)
	{
		auto [ok, session, err] = test_.env->store->Load(id);
		EXPECT_TRUE(ok && session) << id;
		return session ? *session : UploadSession{};
	}

	std::string Object(const UploadSession& session)
	{
		auto [ok, reader, err] = test_.env->sink->OpenRead(session.storage_ref);
		EXPECT_TRUE(ok) << err.message;
		return ok ? ReadAll(*reader) : std::string();
	}

	TestEnvironment test_;
	std::unique_ptr<ChunkAppendProtocol> protocol_;
	RequestContext anonymous_;
};

TEST_F(ChunkAppendProtocolTest, SingleChunkWithoutRangeIsWholeFile)
{
	const std::string data = Pattern(100);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, data), anonymous_);
	ASSERT_TRUE(ok) << err.ToString();
	EXPECT_EQ(receipt.offset, 100u);
	EXPECT_EQ(receipt.upload_id.size(), 32u);

	const UploadSession session = Stored(receipt.upload_id);
	EXPECT_EQ(session.offset, 100u);
	EXPECT_EQ(session.status, UploadStatus::Uploading);
	EXPECT_EQ(session.display_name, "data.bin");
	EXPECT_EQ(Object(session), data);
}

TEST_F(ChunkAppendProtocolTest, EmptyIdStartsNewUpload)
{
	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::string(), "abc"), anonymous_);
	ASSERT_TRUE(ok) << err.ToString();
	EXPECT_FALSE(receipt.upload_id.empty());
}

TEST_F(ChunkAppendProtocolTest, ChunksAccumulateInOrder)
{
	const std::string data = Pattern(100);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, std::string_view(data).substr(0, 50), Range(0, 49, 100)), anonymous_);
	ASSERT_TRUE(ok) << err.ToString();
	EXPECT_EQ(receipt.offset, 50u);

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(receipt.upload_id, std::string_view(data).substr(50), Range(50, 99, 100)), anonymous_);
	ASSERT_TRUE(ok) << err.ToString();
	EXPECT_EQ(receipt.offset, 100u);

	EXPECT_EQ(Object(Stored(receipt.upload_id)), data);
}

TEST_F(ChunkAppendProtocolTest, ReceiptExpiresAfterWindow)
{
	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc"), anonymous_);
	ASSERT_TRUE(ok);

	const UploadSession session = Stored(receipt.upload_id);
	EXPECT_EQ(session.created_at, test_.clock->Now());
	EXPECT_EQ(receipt.expires, session.created_at + test_.env->policy.expiration_window);
}

TEST_F(ChunkAppendProtocolTest, ResentChunkReportsCurrentOffset)
{
	const std::string data = Pattern(100);
	const auto first = std::string_view(data).substr(0, 50);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, first, Range(0, 49, 100)), anonymous_);
	ASSERT_TRUE(ok);
	const std::string id = receipt.upload_id;

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, first, Range(0, 49, 100)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::OffsetMismatch);
	EXPECT_EQ(err.HttpStatus(), 400);
	EXPECT_EQ(err.detail, "Offsets do not match");
	EXPECT_EQ(err.offset, std::optional<uint64_t>(50));

	EXPECT_EQ(Stored(id).offset, 50u);
	EXPECT_EQ(Object(Stored(id)).size(), 50u);
}

TEST_F(ChunkAppendProtocolTest, DeclaredTotalOverLimitIsRejectedBeforeAppend)
{
	UploadPolicy policy;
	policy.max_bytes = 1000;
	Configure(policy);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, Pattern(100), Range(0, 99, 2000)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::SizeLimitExceeded);
	EXPECT_EQ(err.detail, "Size of file exceeds the limit (1000 bytes)");

	EXPECT_EQ(test_.blobs->BlobCount(), 0u);
	EXPECT_TRUE(std::get<1>(test_.env->store->List()).empty());
}

TEST_F(ChunkAppendProtocolTest, TotalAtLimitIsAccepted)
{
	UploadPolicy policy;
	policy.max_bytes = 100;
	Configure(policy);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, Pattern(100)), anonymous_);
	EXPECT_TRUE(ok) << err.ToString();
}

TEST_F(ChunkAppendProtocolTest, MissingChunk)
{
	ChunkRequest request = MakeChunk(std::nullopt, "");
	request.chunk.reset();

	auto [ok, receipt, err] = protocol_->Append(request, anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::MissingChunk);
	EXPECT_EQ(err.detail, "No chunk file was submitted");
}

TEST_F(ChunkAppendProtocolTest, MissingRangeRejectedWhenRequired)
{
	UploadPolicy policy;
	policy.fail_if_no_header = true;
	Configure(policy);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc"), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::MissingRangeHeader);

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(std::nullopt, "abc", std::string("bytes 0-2")), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::MissingRangeHeader);
}

TEST_F(ChunkAppendProtocolTest, MalformedRangeFallsBackToWholeFile)
{
	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abcd", std::string("bytes garbage")), anonymous_);
	ASSERT_TRUE(ok) << err.ToString();
	EXPECT_EQ(receipt.offset, 4u);
}

TEST_F(ChunkAppendProtocolTest, ChunkSizeMustMatchRange)
{
	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, Pattern(40), Range(0, 49, 100)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::SizeMismatch);
	EXPECT_EQ(err.detail, "File size doesn't match headers");

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(std::nullopt, Pattern(40), std::string("bytes 10-5/100")), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::OffsetMismatch);
}

TEST_F(ChunkAppendProtocolTest, EmptyChunkDeclaredAsOneByteIsSizeMismatch)
{
	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "", std::string("bytes 0-0/100")), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::SizeMismatch);
}

TEST_F(ChunkAppendProtocolTest, UnknownUploadIsNotFound)
{
	auto [ok, receipt, err] = protocol_->Append(MakeChunk(*GenerateUploadId(), "abc"), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::NotFound);
	EXPECT_EQ(err.HttpStatus(), 404);
}

TEST_F(ChunkAppendProtocolTest, OtherPrincipalsCannotContinue)
{
	RequestContext alice{ std::string("alice"), "peer" };
	RequestContext bob{ std::string("bob"), "peer" };

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc", Range(0, 2, 6)), alice);
	ASSERT_TRUE(ok);
	EXPECT_EQ(Stored(receipt.upload_id).owner, std::optional<std::string>("alice"));

	const std::string id = receipt.upload_id;

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), bob);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::NotFound);

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::NotFound);

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), alice);
	EXPECT_TRUE(ok) << err.ToString();
}

TEST_F(ChunkAppendProtocolTest, ExpiredUploadRejected)
{
	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc", Range(0, 2, 6)), anonymous_);
	ASSERT_TRUE(ok);

	test_.clock->Advance(std::chrono::hours(24));

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(Stored(receipt.upload_id).id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::Expired);
	EXPECT_EQ(err.HttpStatus(), 410);
}

TEST_F(ChunkAppendProtocolTest, CompletedUploadRejected)
{
	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc", Range(0, 2, 6)), anonymous_);
	ASSERT_TRUE(ok);

	UploadSession session = Stored(receipt.upload_id);
	session.MarkComplete(test_.clock->Now());
	ASSERT_FALSE(test_.env->store->Save(session));

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(session.id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::AlreadyComplete);
}

TEST_F(ChunkAppendProtocolTest, AuthenticationRequired)
{
	UploadPolicy policy;
	policy.require_authentication = true;
	Configure(policy);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc"), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::Forbidden);
	EXPECT_EQ(err.HttpStatus(), 403);

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(std::nullopt, "abc"), RequestContext{ std::string("carol"), "" });
	EXPECT_TRUE(ok) << err.ToString();
}

TEST_F(ChunkAppendProtocolTest, ValidationHookVetoesRequest)
{
	test_.env->hooks.validate = [](const RequestContext&) -> std::optional<UploadError> {
		return UploadError::Make(Kind::ValidationFailed, "quota exceeded");
	};

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc"), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::ValidationFailed);
	EXPECT_EQ(err.detail, "quota exceeded");
	EXPECT_EQ(test_.blobs->BlobCount(), 0u);
}

TEST_F(ChunkAppendProtocolTest, SaveHooksSeeNewAndExistingSessions)
{
	std::vector<bool> pre, post;
	test_.env->hooks.pre_save = [&](UploadSession& session, const RequestContext&, bool is_new) {
		pre.push_back(is_new);
		session.display_name = "renamed.bin";
	};
	test_.env->hooks.post_save = [&](const UploadSession&, const RequestContext&, bool is_new) {
		post.push_back(is_new);
	};

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc", Range(0, 2, 6)), anonymous_);
	ASSERT_TRUE(ok);
	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(receipt.upload_id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_TRUE(ok);

	EXPECT_EQ(pre, (std::vector<bool>{ true, false }));
	EXPECT_EQ(post, (std::vector<bool>{ true, false }));
	EXPECT_EQ(Stored(receipt.upload_id).display_name, "renamed.bin");
}

TEST_F(ChunkAppendProtocolTest, FailedAppendLeavesOffsetUnchanged)
{
	auto sink = std::make_shared<FailingSink>(test_.env->sink);
	test_.env->sink = sink;

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc", Range(0, 2, 6)), anonymous_);
	ASSERT_TRUE(ok);
	const std::string id = receipt.upload_id;

	sink->fail_append = true;
	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::StorageFailure);
	EXPECT_EQ(err.HttpStatus(), 500);
	EXPECT_EQ(Stored(id).offset, 3u);

	sink->fail_append = false;
	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_TRUE(ok) << err.ToString();
	EXPECT_EQ(receipt.offset, 6u);
}

TEST_F(ChunkAppendProtocolTest, LengthDisagreementIsStorageFailure)
{
	TempDir dir;
	test_ = MakeLocalEnvironment(dir.Path());
	auto sink = std::make_shared<FailingSink>(test_.env->sink);
	test_.env->sink = sink;
	protocol_ = std::make_unique<ChunkAppendProtocol>(test_.env);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc", Range(0, 2, 6)), anonymous_);
	ASSERT_TRUE(ok);
	const std::string id = receipt.upload_id;

	sink->short_write = true;
	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::StorageFailure);
	EXPECT_EQ(sink->truncates, 1);

	const UploadSession session = Stored(id);
	EXPECT_EQ(session.offset, 3u);
	EXPECT_EQ(Object(session), "abc");
}

TEST_F(ChunkAppendProtocolTest, FailedSaveRollsBackObject)
{
	TempDir dir;
	test_ = MakeLocalEnvironment(dir.Path());
	auto store = std::make_shared<FailingStore>();
	test_.env->store = store;
	protocol_ = std::make_unique<ChunkAppendProtocol>(test_.env);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc", Range(0, 2, 6)), anonymous_);
	ASSERT_TRUE(ok);
	const std::string id = receipt.upload_id;

	store->failing_saves = 1;
	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::StorageFailure);

	const UploadSession session = Stored(id);
	EXPECT_EQ(session.offset, 3u);
	EXPECT_EQ(Object(session), "abc");
}

TEST_F(ChunkAppendProtocolTest, FailedFirstSaveLeavesNoFile)
{
	TempDir dir;
	test_ = MakeLocalEnvironment(dir.Path());
	auto store = std::make_shared<FailingStore>();
	store->failing_saves = 1;
	test_.env->store = store;
	protocol_ = std::make_unique<ChunkAppendProtocol>(test_.env);

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc"), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::StorageFailure);

	EXPECT_TRUE(std::get<1>(store->List()).empty());

	size_t files = 0;
	for (const auto& entry : std::filesystem::recursive_directory_iterator(dir.Path()))
		if (entry.is_regular_file())
			++files;
	EXPECT_EQ(files, 0u);
}

TEST_F(ChunkAppendProtocolTest, FailedFirstSaveLeavesNoBlob)
{
	auto store = std::make_shared<FailingStore>();
	store->failing_saves = 1;
	test_.env->store = store;

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc"), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::StorageFailure);
	EXPECT_EQ(test_.blobs->BlobCount(), 0u);
}

TEST_F(ChunkAppendProtocolTest, AppendBlobRecoversFromFailedSave)
{
	auto store = std::make_shared<FailingStore>();
	test_.env->store = store;

	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc", Range(0, 2, 6)), anonymous_);
	ASSERT_TRUE(ok) << err.ToString();
	const std::string id = receipt.upload_id;

	store->failing_saves = 1;
	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::StorageFailure);
	EXPECT_EQ(Stored(id).offset, 3u);

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_TRUE(ok) << err.ToString();
	EXPECT_EQ(receipt.offset, 6u);

	std::tie(ok, receipt, err) = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), anonymous_);
	ASSERT_FALSE(ok);
	EXPECT_EQ(err.kind, Kind::OffsetMismatch);

	const UploadSession session = Stored(id);
	EXPECT_EQ(session.offset, 6u);
	EXPECT_EQ(Object(session), "abcdef");
}

TEST_F(ChunkAppendProtocolTest, RandomChunkingPreservesBytes)
{
	std::mt19937 rng(7);
	const std::string data = Pattern(20000, 9);

	std::optional<std::string> id;
	uint64_t offset = 0;
	while (offset < data.size()) {
		const uint64_t size = std::min<uint64_t>(std::uniform_int_distribution<uint64_t>(1, 3000)(rng), data.size() - offset);

		auto [ok, receipt, err] = protocol_->Append(
			MakeChunk(id, std::string_view(data).substr(offset, size), Range(offset, offset + size - 1, data.size())),
			anonymous_);
		ASSERT_TRUE(ok) << err.ToString();

		offset += size;
		EXPECT_EQ(receipt.offset, offset);
		id = receipt.upload_id;
	}

	EXPECT_EQ(Object(Stored(*id)), data);
}

TEST_F(ChunkAppendProtocolTest, ConcurrentDuplicateChunksAppendOnce)
{
	auto [ok, receipt, err] = protocol_->Append(MakeChunk(std::nullopt, "abc", Range(0, 2, 6)), anonymous_);
	ASSERT_TRUE(ok);
	const std::string id = receipt.upload_id;

	std::atomic<int> accepted{ 0 };
	std::atomic<int> mismatched{ 0 };

	std::vector<std::thread> threads;
	for (int i = 0; i < 8; ++i) {
		threads.emplace_back([&] {
			auto [t_ok, t_receipt, t_err] = protocol_->Append(MakeChunk(id, "def", Range(3, 5, 6)), anonymous_);
			if (t_ok)
				++accepted;
			else if (t_err.kind == Kind::OffsetMismatch)
				++mismatched;
		});
	}

	for (auto& t : threads)
		t.join();

	EXPECT_EQ(accepted.load(), 1);
	EXPECT_EQ(mismatched.load(), 7);
	EXPECT_EQ(Stored(id).offset, 6u);
	EXPECT_EQ(Object(Stored(id)), "abcdef");
	EXPECT_EQ(test_.env->locks->Size(), 0u);
}
