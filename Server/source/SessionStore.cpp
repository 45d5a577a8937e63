#include "SessionStore.hpp"

std::tuple<bool, std::optional<UploadSession>, SessionStore::Error>
SessionStore::Find(const std::string& id, const std::optional<std::string>& principal) noexcept
{
	auto [ok, session, err] = Load(id);
	if (!ok)
		return { false, std::nullopt, err };

	if (session && !session->IsOwnedBy(principal))
		return { true, std::nullopt, Error{} };

	return { true, std::move(session), Error{} };
}
