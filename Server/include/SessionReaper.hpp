#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <tuple>

#include "UploadEnvironment.hpp"

// Deletes sessions together with their backing objects.
class SessionReaper
{
public:
	explicit SessionReaper(std::shared_ptr<const UploadEnvironment> env);
	~SessionReaper();

	SessionReaper(const SessionReaper&) = delete;
	SessionReaper& operator=(const SessionReaper&) = delete;

public:
	// Owner-scoped delete of a single upload
	std::optional<UploadError> Delete(const std::string& id, const RequestContext& context);

	// Removes every expired upload that never completed; returns how many were removed
	std::tuple<bool, size_t, UploadError> Sweep();

	void Start(std::chrono::seconds interval);
	void Stop();

private:
	std::optional<UploadError> Reap(const UploadSession& session);
	void Run(std::chrono::seconds interval);

private:
	std::shared_ptr<const UploadEnvironment> env_;

	std::mutex mutex_;
	std::condition_variable cv_;
	bool stopping_ = false;
	std::thread worker_;
};
