#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "FileHasher.hpp"
#include "FileOpsError.hpp"

enum class ChecksumFormat
{
    Sum,    // <hash> *<filename>, md5sum/sha256sum compatible
    Simple  // <filename>: <hash>
};

struct FileDigestInfo
{
    std::string Path;
    bool Exists = false;
    uintmax_t Size = 0;
    int64_t MTime = 0;
    std::string Hash;
    std::string Algorithm;
    std::string Error;
};

class FileVerifier
{
public:
    static constexpr size_t DefaultChunkSize = 64ULL * 1024 * 1024;

    explicit FileVerifier(HashAlgorithm Algorithm = HashAlgorithm::MD5, size_t ChunkSize = DefaultChunkSize);
    virtual ~FileVerifier() = default;

    HashAlgorithm GetAlgorithm() const { return Algorithm; }
    size_t GetChunkSize() const { return ChunkSize; }

    std::string CalculateHash(const std::string& Path) const;
    std::string CalculateHash(const std::string& Path, HashAlgorithm WithAlgorithm) const;

    // Size first, then full-file hashes. Never throws.
    virtual FileResult VerifyCopy(const std::string& SourcePath, const std::string& DestPath) const;

    // Keyed by destination path. MaxWorkers == 0 sizes the pool for CPU bound work.
    ResultMap VerifyBatch(const std::vector<std::pair<std::string, std::string>>& FilePairs, size_t MaxWorkers = 0) const;

    void GenerateChecksumFile(const std::vector<std::string>& FilePaths, const std::string& OutputPath, ChecksumFormat Format = ChecksumFormat::Sum) const;
    // Keyed by the name recorded in the manifest. Names resolve against BaseDir, or the manifest's own directory.
    ResultMap VerifyChecksumFile(const std::string& ChecksumFile, const std::string& BaseDir = "") const;

    // Pairs files by relative path; files absent from DestDir are left out. Keyed by relative path.
    ResultMap CompareDirectories(const std::string& SourceDir, const std::string& DestDir, bool Recursive = true, size_t MaxWorkers = 0) const;

    FileDigestInfo GetFileInfo(const std::string& Path) const;

private:
    HashAlgorithm Algorithm;
    size_t ChunkSize;
};
