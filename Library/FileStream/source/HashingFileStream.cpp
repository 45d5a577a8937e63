#include "HashingFileStream.hpp"

#include <cstdio>
#include <sstream>

HashingFileStream::HashingFileStream(const std::filesystem::path& path, Hasher::Type type)
    : file_(path)
    , hasher_(type)
{
}

const std::filesystem::path& HashingFileStream::GetPath() const noexcept
{
    return file_.GetPath();
}

uint64_t HashingFileStream::BytesHashed() const noexcept
{
    return hashed_;
}

std::optional<HashingFileStream::Error> HashingFileStream::Open() noexcept
{
    digest_.reset();
    hashed_ = 0;

    if (auto err = file_.Open(std::ios::binary | std::ios::in))
        return err;

    if (auto herr = hasher_.Initialize()) {
        (void)file_.Close();
        return ConvertHasherError(*herr);
    }

    return std::nullopt;
}

std::tuple<bool, std::streamsize, HashingFileStream::Error>
HashingFileStream::Read(char* data, std::streamsize size) noexcept
{
    auto [ok, n, err] = file_.Read(data, size);
    if (!ok)
        return { false, n, err };

    if (n <= 0)
        return { true, n, Error{} };

    if (auto herr = hasher_.Update(data, static_cast<size_t>(n)))
        return { false, n, ConvertHasherError(*herr) };

    hashed_ += static_cast<uint64_t>(n);

    return { true, n, Error{} };
}

std::optional<HashingFileStream::Error> HashingFileStream::Close() noexcept
{
    auto [ok, digest, herr] = hasher_.Finalize();
    if (!ok) {
        (void)file_.Close();
        return ConvertHasherError(herr);
    }

    digest_ = std::move(digest);

    return file_.Close();
}

std::optional<std::string> HashingFileStream::GetHashHex() const
{
    if (!digest_)
        return std::nullopt;

    return Hasher::ToHex(*digest_);
}

std::tuple<bool, HashingFileStream::Digest, HashingFileStream::Error>
HashingFileStream::DigestFile(const std::filesystem::path& path, Hasher::Type type) noexcept
{
    HashingFileStream stream(path, type);
    if (auto err = stream.Open())
        return { false, Digest{}, *err };

    std::string buffer(64 * BUFSIZ, '\0');
    while (true) {
        const auto [ok, n, err] = stream.Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (!ok) {
            (void)stream.Close();
            return { false, Digest{}, err };
        }

        if (n <= 0)
            break;
    }

    if (auto err = stream.Close())
        return { false, Digest{}, *err };

    return { true, Digest{ *stream.GetHashHex(), stream.BytesHashed() }, Error{} };
}

HashingFileStream::Error HashingFileStream::ConvertHasherError(const Hasher::Error& e)
{
    std::ostringstream oss;
    oss << "hasher: (" << e.code << ") " << e.message;
    return Error{ e.code, oss.str() };
}
