#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "ConflictResolver.hpp"
#include "EventChannel.hpp"
#include "FileOpsError.hpp"
#include "ProgressTracker.hpp"
#include "TransferControl.hpp"

class FileCopier;
class FileMover;
class FileVerifier;

enum class JobType
{
    Copy,
    Move,
    Delete,
    Verify
};

enum class JobStatus
{
    Queued,
    InProgress,
    Paused,
    Completed,
    Failed,
    Cancelled
};

// Lower value is dequeued first
enum class JobPriority
{
    Critical = 0,
    High = 1,
    Normal = 2,
    Low = 3
};

const char* ToString(JobType Type);
const char* ToString(JobStatus Status);
const char* ToString(JobPriority Priority);
std::optional<JobType> ParseJobType(const std::string& Name);
std::optional<JobStatus> ParseJobStatus(const std::string& Name);
std::optional<JobPriority> ParseJobPriority(const std::string& Name);

inline bool IsTerminal(JobStatus Status)
{
    return Status == JobStatus::Completed || Status == JobStatus::Failed || Status == JobStatus::Cancelled;
}

struct Job
{
    std::string Id;
    JobType Type = JobType::Copy;
    std::vector<std::string> SourcePaths;
    std::vector<std::string> DestPaths;     // Same length as SourcePaths; empty strings for Delete
    JobStatus Status = JobStatus::Queued;
    JobPriority Priority = JobPriority::Normal;
    std::chrono::system_clock::time_point CreatedAt;
    std::optional<std::chrono::system_clock::time_point> StartedAt;
    std::optional<std::chrono::system_clock::time_point> CompletedAt;
    std::string Error;
    bool Verify = false;
    bool PreserveMetadata = true;
    ConflictAction Conflict = ConflictAction::Ask;

    uint64_t TotalSize = 0;
    uint64_t ProcessedSize = 0;
    size_t TotalFiles = 0;          // Fixed at creation: one per source path
    size_t ProcessedFiles = 0;      // Includes skipped
    size_t FailedFiles = 0;
    size_t SkippedFiles = 0;
};

enum class OperationEventType
{
    JobQueued,
    JobStarted,
    FileProgress,
    FileCompleted,
    JobFinished
};

struct OperationEvent
{
    OperationEventType Type = OperationEventType::JobQueued;
    std::string JobId;
    JobStatus Status = JobStatus::Queued;
    std::string Path;               // File events only
    uint64_t Bytes = 0;
    uint64_t Total = 0;
    bool Success = true;
    bool Skipped = false;
    std::string Error;
};

struct ManagerSettings
{
    size_t MaxConcurrentOperations = 2;
    std::string HistoryFile;        // Empty disables persistence
    bool AutoSaveHistory = true;
    std::string RenamePattern = ConflictResolver::DefaultRenamePattern;
    size_t VerifyWorkers = 0;       // 0 sizes the verify pool for CPU bound work
    bool AutoStart = true;          // Otherwise jobs wait for Start()
};

// Priority queue of jobs served by a fixed set of worker threads.
// Job records are guarded by one lock; progress lives in the ProgressTracker under its own lock.
// Listeners are called on a dispatcher thread, never under either lock.
class OperationsManager
{
public:
    using EventListener = std::function<void(const OperationEvent&)>;

    OperationsManager(FileCopier& Copier, FileMover& Mover, FileVerifier& Verifier, ProgressTracker& Tracker, ManagerSettings Settings = ManagerSettings());
    ~OperationsManager();

    OperationsManager(const OperationsManager&) = delete;
    OperationsManager& operator=(const OperationsManager&) = delete;

    void Start();

    // Throw std::invalid_argument unless both lists are non-empty and of equal length
    std::string QueueCopy(const std::vector<std::string>& Sources, const std::vector<std::string>& Dests, JobPriority Priority = JobPriority::Normal, bool Verify = false, bool PreserveMetadata = true, ConflictAction Conflict = ConflictAction::Ask);
    std::string QueueMove(const std::vector<std::string>& Sources, const std::vector<std::string>& Dests, JobPriority Priority = JobPriority::Normal, bool Verify = false, bool PreserveMetadata = true, ConflictAction Conflict = ConflictAction::Ask);
    std::string QueueVerify(const std::vector<std::string>& Sources, const std::vector<std::string>& Dests, JobPriority Priority = JobPriority::Normal);
    std::string QueueDelete(const std::vector<std::string>& Paths, JobPriority Priority = JobPriority::Normal);

    // InProgress -> Paused
    bool Pause(const std::string& JobId);
    // Paused -> InProgress
    bool Resume(const std::string& JobId);
    // Queued or InProgress -> Cancelled
    bool Cancel(const std::string& JobId);

    std::optional<Job> GetJob(const std::string& JobId) const;
    std::vector<Job> ListAll() const;
    std::vector<Job> ListActive() const;
    std::vector<Job> ListQueued() const;
    std::optional<OperationProgress> GetProgress(const std::string& JobId) const;

    // Drops terminal jobs and their progress; returns how many
    size_t ClearCompleted();

    // Terminal jobs only. Both log and return false on failure.
    bool SaveHistory() const;
    bool LoadHistory();

    // Stops dispatch; paused jobs are resumed so in-flight work can drain
    void Shutdown(bool Wait = true);

    void SetConflictCallback(ConflictResolver::AskCallback Callback);
    void Subscribe(EventListener Listener);

    // True once the job is terminal and its worker has let go of it
    bool WaitForJob(const std::string& JobId, std::chrono::milliseconds Timeout);

private:
    struct QueueEntry
    {
        int Priority;
        uint64_t Sequence;
        std::string JobId;
    };

    struct QueueOrder
    {
        bool operator()(const QueueEntry& A, const QueueEntry& B) const
        {
            if (A.Priority != B.Priority)
            {
                return A.Priority > B.Priority;
            }
            return A.Sequence > B.Sequence;
        }
    };

    // One source/destination pair as the worker sees it
    struct WorkItem
    {
        std::string Source;
        std::string Dest;
        std::string Key;            // Progress and result key
        uint64_t Size = 0;
        bool IsDirectory = false;
        bool Skipped = false;
        std::optional<FileResult> Outcome;
    };

    std::string Enqueue(Job NewJob);
    void WorkerLoop();
    void Execute(const Job& Claimed, TransferControl& Control);
    void Finish(const std::string& JobId, const std::optional<std::string>& Failure);

    void ResolveConflicts(const Job& Claimed, std::vector<WorkItem>& Items, TransferControl& Control);
    void CheckFreeSpace(const std::vector<WorkItem>& Items) const;
    void RunTransfers(const Job& Claimed, std::vector<WorkItem>& Items, TransferControl& Control);
    void RunVerify(const Job& Claimed, std::vector<WorkItem>& Items, TransferControl& Control);
    void RunDelete(const Job& Claimed, std::vector<WorkItem>& Items, TransferControl& Control);
    void RecordOutcome(const std::string& JobId, const WorkItem& Item);

    static std::string GenerateJobId();

    FileCopier& Copier;
    FileMover& Mover;
    FileVerifier& Verifier;
    ProgressTracker& Tracker;
    ManagerSettings Settings;

    mutable std::mutex JobsMutex;
    std::condition_variable Jobs_CV;
    std::condition_variable JobDone_CV;
    std::map<std::string, Job> Jobs;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueOrder> PendingQueue;
    std::map<std::string, std::shared_ptr<TransferControl>> Controls;
    uint64_t NextSequence = 0;
    bool Started = false;
    bool Stopping = false;
    std::vector<std::thread> Workers;

    std::mutex CallbackMutex;
    ConflictResolver::AskCallback ConflictCallback;

    mutable std::mutex HistoryMutex;
    EventChannel<OperationEvent> Events;
};
