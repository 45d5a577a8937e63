#include "SessionReaper.hpp"

#include <spdlog/spdlog.h>

#include "SessionRecord.hpp"

using Kind = UploadError::Kind;

SessionReaper::SessionReaper(std::shared_ptr<const UploadEnvironment> env)
	: env_(std::move(env))
{
}

SessionReaper::~SessionReaper()
{
	Stop();
}

std::optional<UploadError> SessionReaper::Reap(const UploadSession& session)
{
	// blob before record, so a failed delete leaves a record the next sweep retries
	if (auto err = env_->sink->Remove(session.storage_ref)) {
		spdlog::error("failed to remove {} for upload {}: {}", session.storage_ref, session.id, err->message);
		return UploadError::Make(Kind::StorageFailure, "failed to remove upload data: " + err->message);
	}

	if (auto err = env_->store->Remove(session.id)) {
		spdlog::error("failed to remove session {}: {}", session.id, err->message);
		return UploadError::Make(Kind::StorageFailure, "failed to remove upload: " + err->message);
	}

	spdlog::debug("reaped upload:\n{}", SessionRecordToString(ToRecord(session)));

	return std::nullopt;
}

std::optional<UploadError> SessionReaper::Delete(const std::string& id, const RequestContext& context)
{
	if (auto err = env_->CheckPermissions(context))
		return err;

	if (id.empty())
		return UploadError::Make(Kind::MissingParameters, "'upload_id' is required");

	auto guard = env_->locks->Acquire(id);

	auto [ok, session, err] = env_->Resolve(id, context);
	if (!ok)
		return err;

	if (auto rerr = Reap(session))
		return rerr;

	spdlog::info("upload {} deleted", id);

	return std::nullopt;
}

std::tuple<bool, size_t, UploadError> SessionReaper::Sweep()
{
	auto [ok, sessions, err] = env_->store->List();
	if (!ok)
		return { false, 0, UploadError::Make(Kind::StorageFailure, "failed to list uploads: " + err.message) };

	size_t reaped = 0;
	for (const auto& listed : sessions) {
		if (listed.IsComplete())
			continue;

		auto guard = env_->locks->Acquire(listed.id);

		// re-read under the lock, the listing may be stale
		auto [found_ok, current, found_err] = env_->store->Load(listed.id);
		if (!found_ok || !current)
			continue;

		if (current->IsComplete() || !current->IsExpired(env_->now(), env_->policy.expiration_window))
			continue;

		if (!Reap(*current))
			++reaped;
	}

	if (reaped != 0)
		spdlog::info("reaper removed {} expired upload(s)", reaped);

	return { true, reaped, UploadError{} };
}

void SessionReaper::Start(std::chrono::seconds interval)
{
	if (worker_.joinable() || interval.count() <= 0)
		return;

	{
		std::lock_guard<std::mutex> lock(mutex_);
		stopping_ = false;
	}

	worker_ = std::thread(&SessionReaper::Run, this, interval);
	spdlog::info("reaper started: interval {}s", interval.count());
}

void SessionReaper::Stop()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stopping_ = true;
	}
	cv_.notify_all();

	if (worker_.joinable())
		worker_.join();
}

void SessionReaper::Run(std::chrono::seconds interval)
{
	std::unique_lock<std::mutex> lock(mutex_);

	while (!cv_.wait_for(lock, interval, [this] { return stopping_; })) {
		lock.unlock();

		const auto [ok, reaped, err] = Sweep();
		if (!ok)
			spdlog::error("reaper sweep failed: {}", err.ToString());

		lock.lock();
	}
}
