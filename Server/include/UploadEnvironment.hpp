#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tuple>

#include "BlobSink.hpp"
#include "SessionLockTable.hpp"
#include "SessionStore.hpp"
#include "UploadError.hpp"
#include "UploadPolicy.hpp"
#include "UploadSession.hpp"

struct RequestContext {
	// Authenticated caller, empty for anonymous requests
	std::optional<std::string> principal;
	std::string peer;
};

// The assembled object handed to the completion hook
struct UploadedFile {
	std::string name;
	uint64_t size = 0;
	std::string storage_ref;
	std::unique_ptr<BlobReader> reader;
};

struct UploadHooks {
	std::function<std::optional<UploadError>(const RequestContext&)> validate;
	std::function<void(UploadSession&, const RequestContext&, bool is_new)> pre_save;
	std::function<void(const UploadSession&, const RequestContext&, bool is_new)> post_save;
	std::function<void(UploadedFile&, const RequestContext&)> on_completion;
};

struct UploadReceipt {
	std::string upload_id;
	uint64_t offset = 0;
	TimePoint expires;
};

// Everything the upload protocols share; built once at startup.
struct UploadEnvironment {
	UploadPolicy policy;
	std::shared_ptr<SessionStore> store;
	std::shared_ptr<BlobSink> sink;
	std::shared_ptr<SessionLockTable> locks = std::make_shared<SessionLockTable>();
	UploadHooks hooks;
	std::function<TimePoint()> now = [] { return Clock::now(); };

	std::optional<UploadError> CheckPermissions(const RequestContext& context) const;
	std::optional<UploadError> RunValidation(const RequestContext& context) const;

	// Owner-scoped lookup; unknown sessions are NotFound
	std::tuple<bool, UploadSession, UploadError> Resolve(const std::string& id, const RequestContext& context) const;

	// pre_save, Save, post_save
	std::optional<UploadError> Persist(UploadSession& session, const RequestContext& context, bool is_new) const;

	UploadReceipt MakeReceipt(const UploadSession& session) const;
};
