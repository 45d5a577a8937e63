#include "SessionLockTable.hpp"

SessionLockTable::Guard::Guard(SessionLockTable* table, std::string id, Entry* entry) noexcept
	: table_(table)
	, id_(std::move(id))
	, entry_(entry)
{
}

SessionLockTable::Guard::Guard(Guard&& other) noexcept
	: table_(other.table_)
	, id_(std::move(other.id_))
	, entry_(other.entry_)
{
	other.table_ = nullptr;
	other.entry_ = nullptr;
}

SessionLockTable::Guard::~Guard()
{
	if (table_ && entry_)
		table_->Release(id_, entry_);
}

SessionLockTable::Guard SessionLockTable::Acquire(const std::string& id)
{
	Entry* entry = nullptr;
	{
		std::lock_guard<std::mutex> lock(mutex_);

		auto& slot = entries_[id];
		if (!slot)
			slot = std::make_unique<Entry>();

		entry = slot.get();
		++entry->users;
	}

	entry->mutex.lock();

	return Guard(this, id, entry);
}

void SessionLockTable::Release(const std::string& id, Entry* entry) noexcept
{
	entry->mutex.unlock();

	std::lock_guard<std::mutex> lock(mutex_);
	if (--entry->users == 0)
		entries_.erase(id);
}

size_t SessionLockTable::Size() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return entries_.size();
}
