#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "UploadSession.hpp"

// Durable records of upload sessions, keyed by upload id.
class SessionStore
{
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	virtual ~SessionStore() = default;

public:
	// Yields no session when id is unknown or belongs to another principal
	std::tuple<bool, std::optional<UploadSession>, Error> Find(const std::string& id, const std::optional<std::string>& principal) noexcept;

public:
	virtual std::tuple<bool, std::optional<UploadSession>, Error> Load(const std::string& id) noexcept = 0;
	virtual std::tuple<bool, bool, Error> Contains(const std::string& id) noexcept = 0;
	virtual std::optional<Error> Save(const UploadSession& session) noexcept = 0;
	virtual std::optional<Error> Remove(const std::string& id) noexcept = 0;
	virtual std::tuple<bool, std::vector<UploadSession>, Error> List() noexcept = 0;
};
