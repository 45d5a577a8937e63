#pragma once

#include <google/protobuf/timestamp.pb.h>

#include "upload_session.pb.h"

#include "UploadSession.hpp"

google::protobuf::Timestamp ToTimestamp(TimePoint tp);
TimePoint FromTimestamp(const google::protobuf::Timestamp& ts);

UploadSessionRecord ToRecord(const UploadSession& session);
UploadSession FromRecord(const UploadSessionRecord& record);

std::string SessionRecordToString(const UploadSessionRecord& record);
