#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "FileStream.hpp"
#include "Hasher.hpp"

// Read-only stream that digests every byte handed out by Read().
// The digest becomes available after Close().
class HashingFileStream final
{
public:
    using Error = FileStream::Error;

    struct Digest {
        std::string hex;
        uint64_t size = 0;
    };

public:
    explicit HashingFileStream(const std::filesystem::path& path, Hasher::Type type);

public:
    const std::filesystem::path& GetPath() const noexcept;
    uint64_t BytesHashed() const noexcept;

public:
    std::optional<Error> Open() noexcept;
    std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept;
    std::optional<Error> Close() noexcept;

public:
    std::optional<std::string> GetHashHex() const;

public:
    // Reads the whole file once; size is the number of bytes that went into hex
    static std::tuple<bool, Digest, Error> DigestFile(const std::filesystem::path& path, Hasher::Type type) noexcept;

private:
    static Error ConvertHasherError(const Hasher::Error& e);

private:
    FileStream file_;
    Hasher hasher_;
    uint64_t hashed_ = 0;
    std::optional<std::vector<uint8_t>> digest_;
};
