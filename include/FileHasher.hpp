#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

enum class HashAlgorithm
{
    CRC32,
    MD5,
    SHA256,
    SHA512,
    BLAKE3
};

const char* ToString(HashAlgorithm Algorithm);
std::optional<HashAlgorithm> ParseHashAlgorithm(const std::string& Name);

// Streaming digest over one of the supported algorithms
class FileHasher
{
public:
    explicit FileHasher(HashAlgorithm Algorithm);
    ~FileHasher();

    FileHasher(const FileHasher&) = delete;
    FileHasher& operator=(const FileHasher&) = delete;

    void Update(const void* Data, size_t Length);
    // Lowercase hex digest; CRC32 is zero padded to 8 digits
    std::string FinalHex();

    HashAlgorithm GetAlgorithm() const { return Algorithm; }

    // Reads Path in ChunkSize pieces, so memory stays bounded for any file size
    static std::string HashFile(const std::string& Path, HashAlgorithm Algorithm, size_t ChunkSize);

private:
    struct State;

    HashAlgorithm Algorithm;
    std::unique_ptr<State> Impl;
    bool Finalized = false;
};
