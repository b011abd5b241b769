#include "FileCopier.hpp"
#include "FileScanner.hpp"
#include "FileVerifier.hpp"
#include "Logger.hpp"
#include "PathUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <future>
#include <limits>
#include <thread>

#ifdef _WIN32
#include <fstream>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace FS = std::filesystem;

#ifndef _WIN32

bool FileCopier::CopyFileRangeSupported = true;

void FileCopier::CheckCopyFileRangeSupport()
{
    int SrcFd = open("/dev/null", O_RDONLY);
    int DestFd = open("/dev/null", O_WRONLY);
    if (SrcFd < 0 || DestFd < 0)
    {
        if (SrcFd >= 0) close(SrcFd);
        if (DestFd >= 0) close(DestFd);
        CopyFileRangeSupported = false;
        return;
    }

    ssize_t Result = copy_file_range(SrcFd, nullptr, DestFd, nullptr, 1, 0);
    CopyFileRangeSupported = (Result >= 0 || errno != ENOSYS);

    close(SrcFd);
    close(DestFd);
}

namespace
{
    struct CopyFileRangeInit
    {
        CopyFileRangeInit()
        {
            FileCopier::CheckCopyFileRangeSupport();
        }
    };

    static CopyFileRangeInit InitCopyFileRangeSupport;

    class ScopedFd
    {
    public:
        explicit ScopedFd(int Fd) : Fd(Fd) {}
        ~ScopedFd()
        {
            if (Fd >= 0)
            {
                close(Fd);
            }
        }

        ScopedFd(const ScopedFd&) = delete;
        ScopedFd& operator=(const ScopedFd&) = delete;

        int Get() const { return Fd; }

        // Close errors on the destination can carry deferred write failures
        int Close()
        {
            int Result = 0;
            if (Fd >= 0)
            {
                Result = close(Fd);
                Fd = -1;
            }
            return Result;
        }

    private:
        int Fd;
    };

    FileOperationError ErrnoError(int ErrorNumber, const std::string& What)
    {
        return FileOperationError(ClassifyErrno(ErrorNumber), What + ": " + std::strerror(ErrorNumber));
    }

    void WriteAll(int Fd, const char* Data, size_t Length, const std::string& Dest)
    {
        while (Length > 0)
        {
            ssize_t Written = write(Fd, Data, Length);
            if (Written < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw ErrnoError(errno, "Write failed for " + Dest);
            }
            Data += Written;
            Length -= static_cast<size_t>(Written);
        }
    }
}

#endif

namespace
{
    // Sleeps in short slices so a cancel does not wait out a long backoff
    bool SleepUnlessCancelled(std::chrono::milliseconds Delay, TransferControl& Control)
    {
        constexpr std::chrono::milliseconds Slice(50);
        auto Deadline = std::chrono::steady_clock::now() + Delay;
        while (std::chrono::steady_clock::now() < Deadline)
        {
            if (Control.IsCancelled())
            {
                return false;
            }
            auto Remaining = std::chrono::duration_cast<std::chrono::milliseconds>(Deadline - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(std::min(Slice, std::max(Remaining, std::chrono::milliseconds(1))));
        }
        return !Control.IsCancelled();
    }
}

FileCopier::FileCopier(size_t MaxWorkers, const FileVerifier* Verifier, unsigned int RetryAttempts, std::chrono::milliseconds RetryDelay)
    : MaxWorkers(MaxWorkers), Verifier(Verifier), RetryAttempts(RetryAttempts == 0 ? 1 : RetryAttempts), RetryDelay(RetryDelay)
{
}

FileCopier::~FileCopier()
{
    Shutdown(true);
}

void FileCopier::Start()
{
    EnsurePool();
}

std::shared_ptr<ThreadPool> FileCopier::EnsurePool()
{
    std::lock_guard<std::mutex> Lock(PoolMutex);
    if (!Pool)
    {
        size_t Workers = MaxWorkers > 0 ? MaxWorkers : ThreadPool::OptimalIOWorkers();
        Pool = std::make_shared<ThreadPool>(Workers);
#ifdef _WIN32
        Log.Info("[FileCopier] Started with " + std::to_string(Workers) + " I/O workers");
#else
        Log.Info("[FileCopier] Started with " + std::to_string(Workers) + " I/O workers, copy_file_range " + (CopyFileRangeSupported ? "supported" : "not supported"));
#endif
    }
    return Pool;
}

void FileCopier::Shutdown(bool Wait)
{
    std::shared_ptr<ThreadPool> Stopping;
    {
        std::lock_guard<std::mutex> Lock(PoolMutex);
        Stopping = std::move(Pool);
    }
    if (!Stopping)
    {
        return;
    }
    if (Wait)
    {
        Stopping->Join();
    }
    // Batch calls still running hold their own reference to the pool
}

bool FileCopier::CopyFile(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, bool PreserveMetadata, bool Verify)
{
    CopyOptions Options;
    Options.PreserveMetadata = PreserveMetadata;
    Options.Verify = Verify;
    return CopyFile(Source, Dest, Progress, Options);
}

bool FileCopier::CopyFile(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options)
{
    TransferControl& Control = Options.Control ? *Options.Control : DefaultControl;
    if (Control.IsCancelled() || !Control.WaitIfPaused())
    {
        return false;
    }

    std::error_code Ec;
    FS::file_status SourceStatus = FS::status(Source, Ec);
    if (Ec || !FS::exists(SourceStatus))
    {
        throw FileOperationError(FileErrorKind::SourceNotFound, "Source file not found: " + Source);
    }
    if (!FS::is_regular_file(SourceStatus))
    {
        throw FileOperationError(FileErrorKind::IOError, "Source is not a regular file: " + Source);
    }
    uint64_t FileSize = FS::file_size(Source, Ec);
    if (Ec)
    {
        throw FileOperationError(ClassifyErrorCode(Ec), "Cannot read size of " + Source + ": " + Ec.message());
    }

    uintmax_t Reclaimable = 0;
    if (FS::is_regular_file(Dest, Ec))
    {
        if (FS::equivalent(Source, Dest, Ec))
        {
            throw FileOperationError(FileErrorKind::IOError, "Source and destination are the same file: " + Source);
        }
        Reclaimable = FS::file_size(Dest, Ec);
        if (Ec)
        {
            Reclaimable = 0;
        }
    }

    FS::path Parent = FS::path(Dest).parent_path();
    if (!Parent.empty())
    {
        FS::create_directories(PathUtils::NormalizeLongPath(Parent), Ec);
        if (Ec)
        {
            throw FileOperationError(ClassifyErrorCode(Ec), "Cannot create destination directory " + Parent.string() + ": " + Ec.message());
        }
    }

    uintmax_t Required = FileSize > Reclaimable ? FileSize - Reclaimable : 0;
    auto [Enough, FreeBytes] = CheckSpaceAvailable(Dest, Required);
    if (!Enough)
    {
        throw FileOperationError(FileErrorKind::DiskFull, "Insufficient space for " + Dest + ": need " + std::to_string(Required) + " bytes, " + std::to_string(FreeBytes) + " free");
    }

    size_t BufferSize = GetOptimalBufferSize(FileSize, Source, Dest);
    Log.Info("[FileCopier] Copying File: " + Source + " → " + Dest);

    try
    {
        if (!TransferContents(Source, Dest, FileSize, BufferSize, Progress, Control))
        {
            RemovePartial(Dest);
            Log.Info("[FileCopier] Cancelled, partial destination removed: " + Dest);
            return false;
        }

        if (Options.PreserveMetadata)
        {
            CopyMetadata(Source, Dest);
        }

        if (Options.Verify && Verifier)
        {
            FileResult Verified = Verifier->VerifyCopy(Source, Dest);
            if (!Verified.Success)
            {
                FileErrorKind Kind = Verified.Kind == FileErrorKind::None ? FileErrorKind::HashMismatch : Verified.Kind;
                throw FileOperationError(Kind, "Verification failed: " + Verified.Error);
            }
        }
    }
    catch (const std::exception& e)
    {
        RemovePartial(Dest);
        Log.Error("[FileCopier] Copy Failed: " + Source + " | Reason: " + e.what());
        throw;
    }
    return true;
}

#ifdef _WIN32

bool FileCopier::TransferContents(const std::string& Source, const std::string& Dest, uint64_t FileSize, size_t BufferSize, const ProgressCallback& Progress, TransferControl& Control)
{
    std::ifstream Input(PathUtils::NormalizeLongPath(Source), std::ios::binary);
    if (!Input.is_open())
    {
        throw FileOperationError(FileErrorKind::PermissionDenied, "Failed to open source file: " + Source);
    }
    std::ofstream Output(PathUtils::NormalizeLongPath(Dest), std::ios::binary | std::ios::trunc);
    if (!Output.is_open())
    {
        throw FileOperationError(FileErrorKind::PermissionDenied, "Failed to open destination file: " + Dest);
    }

    std::vector<char> Buffer(BufferSize);
    uint64_t Copied = 0;
    while (true)
    {
        if (Control.IsCancelled() || !Control.WaitIfPaused())
        {
            Output.close();
            return false;
        }

        Input.read(Buffer.data(), static_cast<std::streamsize>(Buffer.size()));
        std::streamsize Got = Input.gcount();
        if (Got <= 0)
        {
            break;
        }
        Output.write(Buffer.data(), Got);
        if (!Output)
        {
            throw FileOperationError(FileErrorKind::IOError, "Write failed for " + Dest);
        }
        Copied += static_cast<uint64_t>(Got);
        if (Progress)
        {
            Progress(Copied, FileSize);
        }
    }
    if (Input.bad())
    {
        throw FileOperationError(FileErrorKind::IOError, "Read failed for " + Source);
    }
    if (Copied == 0 && Progress)
    {
        Progress(0, FileSize);
    }

    Output.close();
    if (!Output)
    {
        throw FileOperationError(FileErrorKind::IOError, "Failed to finalise " + Dest);
    }
    return true;
}

void FileCopier::CopyMetadata(const std::string& Source, const std::string& Dest)
{
    std::error_code Ec;
    FS::file_time_type MTime = FS::last_write_time(Source, Ec);
    if (!Ec)
    {
        FS::last_write_time(Dest, MTime, Ec);
    }
    if (Ec)
    {
        Log.Error("[FileCopier] Failed to copy timestamps to " + Dest + ": " + Ec.message());
    }

    FS::perms Permissions = FS::status(Source, Ec).permissions();
    if (!Ec)
    {
        FS::permissions(Dest, Permissions, Ec);
    }
    if (Ec)
    {
        Log.Error("[FileCopier] Failed to copy permissions to " + Dest + ": " + Ec.message());
    }
}

#else

bool FileCopier::TransferContents(const std::string& Source, const std::string& Dest, uint64_t FileSize, size_t BufferSize, const ProgressCallback& Progress, TransferControl& Control)
{
    ScopedFd SourceFd(open(Source.c_str(), O_RDONLY | O_CLOEXEC));
    if (SourceFd.Get() < 0)
    {
        throw ErrnoError(errno, "Failed to open source file " + Source);
    }

    struct stat SourceStat;
    if (fstat(SourceFd.Get(), &SourceStat) != 0)
    {
        throw ErrnoError(errno, "Failed to stat source file " + Source);
    }
    mode_t Mode = (SourceStat.st_mode & 0777) | S_IWUSR;

    ScopedFd DestFd(open(Dest.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, Mode));
    if (DestFd.Get() < 0)
    {
        throw ErrnoError(errno, "Failed to open destination file " + Dest);
    }

    bool UseCopyRange = CopyFileRangeSupported;
    std::vector<char> Buffer;
    uint64_t Copied = 0;

    while (true)
    {
        if (Control.IsCancelled() || !Control.WaitIfPaused())
        {
            return false;
        }

        ssize_t Moved = 0;
        if (UseCopyRange)
        {
            Moved = copy_file_range(SourceFd.Get(), nullptr, DestFd.Get(), nullptr, BufferSize, 0);
            if (Moved < 0)
            {
                int Error = errno;
                if (Error == EINTR)
                {
                    continue;
                }
                // Filesystems without in-kernel copy support; file offsets are untouched on failure
                if (Error == EXDEV || Error == EINVAL || Error == ENOSYS || Error == EOPNOTSUPP)
                {
                    UseCopyRange = false;
                    continue;
                }
                throw ErrnoError(Error, "Copy failed for " + Dest);
            }
        }
        else
        {
            if (Buffer.empty())
            {
                Buffer.resize(BufferSize);
            }
            Moved = read(SourceFd.Get(), Buffer.data(), Buffer.size());
            if (Moved < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw ErrnoError(errno, "Read failed for " + Source);
            }
            WriteAll(DestFd.Get(), Buffer.data(), static_cast<size_t>(Moved), Dest);
        }

        if (Moved == 0)
        {
            break;
        }
        Copied += static_cast<uint64_t>(Moved);
        if (Progress)
        {
            Progress(Copied, FileSize);
        }
    }

    if (Copied == 0 && Progress)
    {
        Progress(0, FileSize);
    }

    if (DestFd.Close() != 0)
    {
        throw ErrnoError(errno, "Failed to close destination file " + Dest);
    }
    return true;
}

void FileCopier::CopyMetadata(const std::string& Source, const std::string& Dest)
{
    struct stat SourceStat;
    if (stat(Source.c_str(), &SourceStat) != 0)
    {
        Log.Error("[FileCopier] Failed to stat " + Source + " for metadata: " + std::strerror(errno));
        return;
    }

    struct timespec Times[2] = { SourceStat.st_atim, SourceStat.st_mtim };
    if (utimensat(AT_FDCWD, Dest.c_str(), Times, 0) != 0)
    {
        Log.Error("[FileCopier] Failed to copy timestamps to " + Dest + ": " + std::strerror(errno));
    }
    if (chmod(Dest.c_str(), SourceStat.st_mode & 07777) != 0)
    {
        Log.Error("[FileCopier] Failed to copy permissions to " + Dest + ": " + std::strerror(errno));
    }
}

#endif

void FileCopier::RemovePartial(const std::string& Dest)
{
    std::error_code Ec;
    FS::remove(Dest, Ec);
    if (Ec)
    {
        Log.Error("[FileCopier] Failed to remove partial file " + Dest + ": " + Ec.message());
    }
}

FileResult FileCopier::CopyFileWithRetry(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options)
{
    return CopyFileWithRetry(Source, Dest, Progress, Options, RetryAttempts, RetryDelay);
}

FileResult FileCopier::CopyFileWithRetry(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options, unsigned int Attempts, std::chrono::milliseconds BaseDelay)
{
    TransferControl& Control = Options.Control ? *Options.Control : DefaultControl;
    Attempts = std::max(1u, Attempts);
    std::string LastError = "Copy did not complete";

    for (unsigned int Attempt = 0; Attempt < Attempts; ++Attempt)
    {
        try
        {
            if (CopyFile(Source, Dest, Progress, Options))
            {
                return FileResult::Ok();
            }
            if (Control.IsCancelled())
            {
                return FileResult::Cancelled();
            }
        }
        catch (const FileOperationError& e)
        {
            if (IsVerificationMismatch(e.GetKind()))
            {
                return FileResult::Failure(e.GetKind(), e.what());
            }
            LastError = e.what();
        }
        catch (const std::exception& e)
        {
            LastError = e.what();
        }

        if (Control.IsCancelled())
        {
            return FileResult::Cancelled();
        }

        Log.Error("[FileCopier] Attempt " + std::to_string(Attempt + 1) + "/" + std::to_string(Attempts) + " failed for " + Dest + ": " + LastError);

        if (Attempt + 1 < Attempts)
        {
            std::chrono::milliseconds Delay = BaseDelay * (1LL << std::min(Attempt, 20u));
            if (!SleepUnlessCancelled(Delay, Control))
            {
                return FileResult::Cancelled();
            }
        }
    }

    return FileResult::Failure(FileErrorKind::RetryExhausted, LastError);
}

ResultMap FileCopier::CopyFilesBatch(const std::vector<std::pair<std::string, std::string>>& FilePairs, const BatchProgressCallback& Progress, const CopyOptions& Options)
{
    ResultMap Results;
    if (FilePairs.empty())
    {
        return Results;
    }

    std::shared_ptr<ThreadPool> Workers = EnsurePool();
    std::vector<std::pair<std::string, std::future<FileResult>>> Pending;
    Pending.reserve(FilePairs.size());

    for (const auto& Pair : FilePairs)
    {
        ProgressCallback FileProgress;
        if (Progress)
        {
            FileProgress = [Progress, Dest = Pair.second](uint64_t Copied, uint64_t Total) { Progress(Dest, Copied, Total); };
        }
        Pending.emplace_back(Pair.second, Workers->SubmitTask([this, Source = Pair.first, Dest = Pair.second, FileProgress, Options]()
        {
                return CopyFileWithRetry(Source, Dest, FileProgress, Options);
        }));
    }

    for (auto& [Dest, Future] : Pending)
    {
        try
        {
            Results[Dest] = Future.get();
        }
        catch (const std::exception& e)
        {
            Results[Dest] = FileResult::Failure(FileErrorKind::IOError, e.what());
        }
    }
    return Results;
}

ResultMap FileCopier::CopyDirectory(const std::string& SourceDir, const std::string& DestDir, const BatchProgressCallback& Progress, const CopyOptions& Options)
{
    std::error_code Ec;
    if (!FS::is_directory(SourceDir, Ec))
    {
        throw FileOperationError(FileErrorKind::SourceNotFound, "Source directory not found: " + SourceDir);
    }

    FileScanner Scanner;
    if (!Scanner.Scan(SourceDir, true))
    {
        Log.Error("[FileCopier] " + std::to_string(Scanner.GetErrors().size()) + " entries could not be read under " + SourceDir);
    }

    FS::path SourceRoot(SourceDir);
    FS::path DestRoot(DestDir);

    FS::create_directories(DestRoot, Ec);
    if (Ec)
    {
        throw FileOperationError(ClassifyErrorCode(Ec), "Cannot create destination directory " + DestDir + ": " + Ec.message());
    }
    // Empty directories are part of the tree too
    for (const auto& Dir : Scanner.GetDirectoriesDeepestFirst())
    {
        FS::create_directories(DestRoot / Dir.lexically_relative(SourceRoot), Ec);
        if (Ec)
        {
            Log.Error("[FileCopier] Cannot create directory under " + DestDir + ": " + Ec.message());
        }
    }

    std::vector<std::pair<std::string, std::string>> FilePairs;
    FilePairs.reserve(Scanner.GetFiles().size());
    for (const auto& File : Scanner.GetFiles())
    {
        FilePairs.emplace_back(File.AbsolutePath.string(), (DestRoot / File.RelativePath).string());
    }

    Log.Info("[FileCopier] Copying directory " + SourceDir + " → " + DestDir + " (" + std::to_string(FilePairs.size()) + " files)");
    return CopyFilesBatch(FilePairs, Progress, Options);
}

void FileCopier::Pause()
{
    DefaultControl.Pause();
}

void FileCopier::Resume()
{
    DefaultControl.Resume();
}

void FileCopier::Cancel()
{
    DefaultControl.Cancel();
}

void FileCopier::ResetCancel()
{
    DefaultControl.ResetCancel();
}

size_t FileCopier::GetOptimalBufferSize(uint64_t FileSize, bool SameVolume)
{
    uint64_t BufferSize;
    if (FileSize < 1 * MB)
    {
        BufferSize = 4 * KB;
    }
    else if (FileSize < 10 * MB)
    {
        BufferSize = 512 * KB;
    }
    else if (FileSize < 100 * MB)
    {
        BufferSize = 2 * MB;
    }
    else if (FileSize < 1 * GB)
    {
        BufferSize = 16 * MB;
    }
    else if (FileSize < 10 * GB)
    {
        BufferSize = 64 * MB;
    }
    else
    {
        BufferSize = 128 * MB;
    }

    if (SameVolume)
    {
        BufferSize = std::min<uint64_t>(BufferSize * 2, 256 * MB);
    }
    else
    {
        // Streaming across devices favours more, smaller transfers in flight
        BufferSize = std::min<uint64_t>(BufferSize, 64 * MB);
    }
    return static_cast<size_t>(BufferSize);
}

size_t FileCopier::GetOptimalBufferSize(uint64_t FileSize, const std::string& Source, const std::string& Dest)
{
    return GetOptimalBufferSize(FileSize, PathUtils::IsSameVolume(Source, Dest));
}

uintmax_t FileCopier::GetFreeSpace(const std::string& Path)
{
    FS::path Existing = PathUtils::NearestExistingPath(Path);
    if (Existing.empty())
    {
        throw FileOperationError(FileErrorKind::SourceNotFound, "No existing volume for " + Path);
    }

    std::error_code Ec;
    FS::space_info Info = FS::space(Existing, Ec);
    if (Ec)
    {
        throw FileOperationError(ClassifyErrorCode(Ec), "Cannot query free space for " + Path + ": " + Ec.message());
    }
    return Info.available;
}

std::pair<bool, uintmax_t> FileCopier::CheckSpaceAvailable(const std::string& DestPath, uintmax_t RequiredBytes)
{
    try
    {
        uintmax_t FreeBytes = GetFreeSpace(DestPath);
        return { FreeBytes >= RequiredBytes, FreeBytes };
    }
    catch (const FileOperationError& e)
    {
        Log.Error(std::string("[FileCopier] ") + e.what());
        return { true, std::numeric_limits<uintmax_t>::max() };
    }
}

double FileCopier::GetCopySpeed(uint64_t BytesCopied, double ElapsedSeconds)
{
    return ElapsedSeconds > 0.0 ? static_cast<double>(BytesCopied) / ElapsedSeconds : 0.0;
}

std::optional<double> FileCopier::EstimateTimeRemaining(uint64_t BytesCopied, uint64_t TotalBytes, double CurrentSpeed)
{
    if (CurrentSpeed <= 0.0)
    {
        return std::nullopt;
    }
    uint64_t Remaining = TotalBytes > BytesCopied ? TotalBytes - BytesCopied : 0;
    return static_cast<double>(Remaining) / CurrentSpeed;
}
