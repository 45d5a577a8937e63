#include "UploadEnvironment.hpp"

#include <spdlog/spdlog.h>

using Kind = UploadError::Kind;

std::optional<UploadError> UploadEnvironment::CheckPermissions(const RequestContext& context) const
{
	if (policy.require_authentication && !context.principal)
		return UploadError::Make(Kind::Forbidden, "Authentication credentials were not provided");

	return std::nullopt;
}

std::optional<UploadError> UploadEnvironment::RunValidation(const RequestContext& context) const
{
	if (!hooks.validate)
		return std::nullopt;

	return hooks.validate(context);
}

std::tuple<bool, UploadSession, UploadError>
UploadEnvironment::Resolve(const std::string& id, const RequestContext& context) const
{
	auto [ok, session, err] = store->Find(id, context.principal);
	if (!ok) {
		spdlog::error("failed to load session {}: {}", id, err.message);
		return { false, UploadSession{}, UploadError::Make(Kind::StorageFailure, "failed to load upload: " + err.message) };
	}

	if (!session)
		return { false, UploadSession{}, UploadError::Make(Kind::NotFound, "No upload matches the given upload_id") };

	return { true, std::move(*session), UploadError{} };
}

std::optional<UploadError> UploadEnvironment::Persist(UploadSession& session, const RequestContext& context, bool is_new) const
{
	if (hooks.pre_save)
		hooks.pre_save(session, context, is_new);

	if (auto err = store->Save(session)) {
		spdlog::error("failed to save session {}: {}", session.id, err->message);
		return UploadError::Make(Kind::StorageFailure, "failed to save upload: " + err->message);
	}

	if (hooks.post_save)
		hooks.post_save(session, context, is_new);

	return std::nullopt;
}

UploadReceipt UploadEnvironment::MakeReceipt(const UploadSession& session) const
{
	return UploadReceipt{ session.id, session.offset, session.ExpiresAt(policy.expiration_window) };
}
