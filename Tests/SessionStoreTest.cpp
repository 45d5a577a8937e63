#include <gtest/gtest.h>

#include <memory>

#include "FileSessionStore.hpp"
#include "MemorySessionStore.hpp"

#include "TestSupport.hpp"

namespace {
	UploadSession MakeSession(std::optional<std::string> owner = std::nullopt)
	{
		UploadSession session;
		session.id = *GenerateUploadId();
		session.display_name = "report.pdf";
		session.offset = 42;
		session.created_at = TimePoint(std::chrono::seconds(1700000000));
		session.owner = std::move(owner);
		session.storage_ref = MakeStorageRef("chunked_uploads", session.id, session.created_at);

		return session;
	}
}

class SessionStoreTest : public ::testing::TestWithParam<std::string>
{
protected:
	void SetUp() override
	{
		if (GetParam() == "file")
			store_ = std::make_shared<FileSessionStore>(dir_.Path());
		else
			store_ = std::make_shared<MemorySessionStore>();
	}

	TempDir dir_;
	std::shared_ptr<SessionStore> store_;
};

TEST_P(SessionStoreTest, SaveThenLoad)
{
	UploadSession session = MakeSession("alice");
	session.MarkComplete(session.created_at + std::chrono::seconds(30));
	session.cached_checksum = "ignored";

	ASSERT_FALSE(store_->Save(session));

	auto [ok, loaded, err] = store_->Load(session.id);
	ASSERT_TRUE(ok) << err.message;
	ASSERT_TRUE(loaded);

	EXPECT_EQ(loaded->id, session.id);
	EXPECT_EQ(loaded->storage_ref, session.storage_ref);
	EXPECT_EQ(loaded->display_name, "report.pdf");
	EXPECT_EQ(loaded->offset, 42u);
	EXPECT_EQ(loaded->created_at, session.created_at);
	EXPECT_EQ(loaded->completed_at, session.completed_at);
	EXPECT_EQ(loaded->status, UploadStatus::Complete);
	EXPECT_EQ(loaded->owner, std::optional<std::string>("alice"));
}

TEST_P(SessionStoreTest, SaveReplacesExisting)
{
	UploadSession session = MakeSession();
	ASSERT_FALSE(store_->Save(session));

	session.Advance(8);
	ASSERT_FALSE(store_->Save(session));

	auto [ok, loaded, err] = store_->Load(session.id);
	ASSERT_TRUE(ok && loaded);
	EXPECT_EQ(loaded->offset, 50u);
}

TEST_P(SessionStoreTest, UnknownIdYieldsNothing)
{
	auto [ok, loaded, err] = store_->Load(*GenerateUploadId());
	EXPECT_TRUE(ok);
	EXPECT_FALSE(loaded);

	auto [contains_ok, contains, contains_err] = store_->Contains(*GenerateUploadId());
	EXPECT_TRUE(contains_ok);
	EXPECT_FALSE(contains);
}

TEST_P(SessionStoreTest, FindIsScopedToOwner)
{
	const UploadSession owned = MakeSession("alice");
	const UploadSession anonymous = MakeSession();
	ASSERT_FALSE(store_->Save(owned));
	ASSERT_FALSE(store_->Save(anonymous));

	EXPECT_TRUE(std::get<1>(store_->Find(owned.id, std::string("alice"))));
	EXPECT_FALSE(std::get<1>(store_->Find(owned.id, std::string("bob"))));
	EXPECT_FALSE(std::get<1>(store_->Find(owned.id, std::nullopt)));

	EXPECT_TRUE(std::get<1>(store_->Find(anonymous.id, std::nullopt)));
	EXPECT_FALSE(std::get<1>(store_->Find(anonymous.id, std::string("alice"))));
}

TEST_P(SessionStoreTest, RemoveAndList)
{
	const UploadSession first = MakeSession();
	const UploadSession second = MakeSession();
	ASSERT_FALSE(store_->Save(first));
	ASSERT_FALSE(store_->Save(second));

	auto [ok, sessions, err] = store_->List();
	ASSERT_TRUE(ok);
	EXPECT_EQ(sessions.size(), 2u);

	ASSERT_FALSE(store_->Remove(first.id));
	EXPECT_FALSE(std::get<1>(store_->Contains(first.id)));
	EXPECT_TRUE(std::get<1>(store_->Contains(second.id)));

	std::tie(ok, sessions, err) = store_->List();
	ASSERT_TRUE(ok);
	ASSERT_EQ(sessions.size(), 1u);
	EXPECT_EQ(sessions[0].id, second.id);

	EXPECT_FALSE(store_->Remove(first.id));
}

INSTANTIATE_TEST_SUITE_P(Stores, SessionStoreTest, ::testing::Values("memory", "file"));

TEST(FileSessionStoreTest, SurvivesReopen)
{
	TempDir dir;
	const UploadSession session = MakeSession();

	ASSERT_FALSE(FileSessionStore(dir.Path()).Save(session));

	FileSessionStore reopened(dir.Path());
	auto [ok, loaded, err] = reopened.Load(session.id);
	ASSERT_TRUE(ok && loaded);
	EXPECT_EQ(loaded->offset, session.offset);
	EXPECT_FALSE(loaded->cached_checksum);
}

TEST(FileSessionStoreTest, RejectsMalformedIds)
{
	TempDir dir;
	FileSessionStore store(dir.Path());

	auto [ok, loaded, err] = store.Load("../../etc/passwd");
	EXPECT_TRUE(ok);
	EXPECT_FALSE(loaded);

	UploadSession session = MakeSession();
	session.id = "../escape";
	EXPECT_TRUE(store.Save(session));
}

TEST(FileSessionStoreTest, ListSkipsCorruptRecords)
{
	TempDir dir;
	FileSessionStore store(dir.Path());

	ASSERT_FALSE(store.Save(MakeSession()));
	WriteFile(dir.Path() / "0123456789abcdef0123456789abcdef.session", std::string("\x0a\x7f", 2));

	auto [ok, sessions, err] = store.List();
	ASSERT_TRUE(ok);
	EXPECT_EQ(sessions.size(), 1u);
}
