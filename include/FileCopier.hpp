#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "FileOpsError.hpp"
#include "ThreadPool.hpp"
#include "TransferControl.hpp"

class FileVerifier;

// (bytes copied, total bytes); the last call of a finished copy has both equal
using ProgressCallback = std::function<void(uint64_t Copied, uint64_t Total)>;
// (destination path, bytes copied, total bytes)
using BatchProgressCallback = std::function<void(const std::string& DestPath, uint64_t Copied, uint64_t Total)>;

struct CopyOptions
{
    bool PreserveMetadata = true;
    bool Verify = false;                // Needs a FileVerifier
    TransferControl* Control = nullptr; // nullptr uses the copier-wide control
};

class FileCopier
{
public:
    static constexpr uint64_t KB = 1024ULL;
    static constexpr uint64_t MB = 1024ULL * KB;
    static constexpr uint64_t GB = 1024ULL * MB;

    explicit FileCopier(size_t MaxWorkers = 0, const FileVerifier* Verifier = nullptr, unsigned int RetryAttempts = 3, std::chrono::milliseconds RetryDelay = std::chrono::milliseconds(1000));
    virtual ~FileCopier();

    FileCopier(const FileCopier&) = delete;
    FileCopier& operator=(const FileCopier&) = delete;

    // Batch pool lifecycle. Batch calls start the pool on demand.
    void Start();
    void Shutdown(bool Wait = true);

    // Verifies only when asked to, even with a verifier attached
    bool CopyFile(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress = nullptr, bool PreserveMetadata = true, bool Verify = false);

    // Returns false when cancelled, with the partial destination removed.
    // Throws FileOperationError on failure; no partial destination is left behind.
    virtual bool CopyFile(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options);

    // Exponential backoff: the wait after attempt i is RetryDelay * 2^i.
    // Verification mismatches and cancellation are never retried.
    FileResult CopyFileWithRetry(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options);
    FileResult CopyFileWithRetry(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options, unsigned int Attempts, std::chrono::milliseconds BaseDelay);

    // Fans out over the I/O pool; keyed by destination. Completion order is unspecified.
    ResultMap CopyFilesBatch(const std::vector<std::pair<std::string, std::string>>& FilePairs, const BatchProgressCallback& Progress = nullptr, const CopyOptions& Options = CopyOptions());
    ResultMap CopyDirectory(const std::string& SourceDir, const std::string& DestDir, const BatchProgressCallback& Progress = nullptr, const CopyOptions& Options = CopyOptions());

    void Pause();
    void Resume();
    void Cancel();
    void ResetCancel();
    TransferControl& GetControl() { return DefaultControl; }

    const FileVerifier* GetVerifier() const { return Verifier; }
    unsigned int GetRetryAttempts() const { return RetryAttempts; }
    std::chrono::milliseconds GetRetryDelay() const { return RetryDelay; }

    static size_t GetOptimalBufferSize(uint64_t FileSize, bool SameVolume);
    static size_t GetOptimalBufferSize(uint64_t FileSize, const std::string& Source, const std::string& Dest);

    // Free bytes on the volume that holds (or would hold) Path. Throws FileOperationError.
    static uintmax_t GetFreeSpace(const std::string& Path);
    // (enough space, free bytes); reports available when the volume cannot be queried
    static std::pair<bool, uintmax_t> CheckSpaceAvailable(const std::string& DestPath, uintmax_t RequiredBytes);

    static double GetCopySpeed(uint64_t BytesCopied, double ElapsedSeconds);
    static std::optional<double> EstimateTimeRemaining(uint64_t BytesCopied, uint64_t TotalBytes, double CurrentSpeed);

#ifndef _WIN32
    static bool CopyFileRangeSupported;
    static void CheckCopyFileRangeSupport();
#endif

private:
    bool TransferContents(const std::string& Source, const std::string& Dest, uint64_t FileSize, size_t BufferSize, const ProgressCallback& Progress, TransferControl& Control);
    static void CopyMetadata(const std::string& Source, const std::string& Dest);
    static void RemovePartial(const std::string& Dest);
    std::shared_ptr<ThreadPool> EnsurePool();

    size_t MaxWorkers;
    const FileVerifier* Verifier;
    unsigned int RetryAttempts;
    std::chrono::milliseconds RetryDelay;

    TransferControl DefaultControl;

    std::mutex PoolMutex;
    std::shared_ptr<ThreadPool> Pool;
};
