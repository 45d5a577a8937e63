#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

// Serializes work on a single upload session across request threads.
class SessionLockTable
{
private:
	struct Entry {
		std::mutex mutex;
		size_t users = 0;
	};

public:
	class Guard
	{
	public:
		Guard(const Guard&) = delete;
		Guard& operator=(const Guard&) = delete;
		Guard(Guard&& other) noexcept;
		Guard& operator=(Guard&&) = delete;
		~Guard();

	private:
		friend class SessionLockTable;
		Guard(SessionLockTable* table, std::string id, Entry* entry) noexcept;

	private:
		SessionLockTable* table_;
		std::string id_;
		Entry* entry_;
	};

public:
	// Blocks until no other guard for id is alive
	Guard Acquire(const std::string& id);

	size_t Size() const;

private:
	void Release(const std::string& id, Entry* entry) noexcept;

private:
	mutable std::mutex mutex_;
	std::map<std::string, std::unique_ptr<Entry>> entries_;
};
