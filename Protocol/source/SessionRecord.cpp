#include "SessionRecord.hpp"

#include <sstream>

#include <google/protobuf/util/time_util.h>

using google::protobuf::util::TimeUtil;

google::protobuf::Timestamp ToTimestamp(TimePoint tp)
{
	const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
	return TimeUtil::NanosecondsToTimestamp(ns.count());
}

TimePoint FromTimestamp(const google::protobuf::Timestamp& ts)
{
	const std::chrono::nanoseconds ns(TimeUtil::TimestampToNanoseconds(ts));
	return TimePoint(std::chrono::duration_cast<Clock::duration>(ns));
}

UploadSessionRecord ToRecord(const UploadSession& session)
{
	UploadSessionRecord record;

	record.set_upload_id(session.id);
	record.set_storage_ref(session.storage_ref);
	record.set_filename(session.display_name);
	record.set_offset(session.offset);
	record.set_status(static_cast<uint32_t>(session.status));

	*record.mutable_created_on() = ToTimestamp(session.created_at);
	if (session.completed_at)
		*record.mutable_completed_on() = ToTimestamp(*session.completed_at);

	if (session.owner)
		record.set_owner(*session.owner);

	return record;
}

UploadSession FromRecord(const UploadSessionRecord& record)
{
	UploadSession session;

	session.id = record.upload_id();
	session.storage_ref = record.storage_ref();
	session.display_name = record.filename();
	session.offset = record.offset();
	session.status = static_cast<UploadStatus>(record.status());
	session.created_at = FromTimestamp(record.created_on());

	if (record.has_completed_on())
		session.completed_at = FromTimestamp(record.completed_on());

	if (record.has_owner())
		session.owner = record.owner();

	return session;
}

std::string SessionRecordToString(const UploadSessionRecord& record)
{
	std::stringstream ss;

	ss << "upload_id: " << record.upload_id() << std::endl;
	ss << "storage_ref: " << record.storage_ref() << std::endl;
	ss << "filename: " << record.filename() << std::endl;
	ss << "offset: " << record.offset() << std::endl;
	ss << "status: " << record.status() << std::endl;
	ss << "created_on: " << TimeUtil::ToString(record.created_on()) << std::endl;
	if (record.has_completed_on())
		ss << "completed_on: " << TimeUtil::ToString(record.completed_on()) << std::endl;
	if (record.has_owner())
		ss << "owner: " << record.owner() << std::endl;

	return ss.str();
}
