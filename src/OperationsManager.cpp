#include "OperationsManager.hpp"
#include "FileCopier.hpp"
#include "FileMover.hpp"
#include "FileScanner.hpp"
#include "FileVerifier.hpp"
#include "Logger.hpp"
#include "PathUtils.hpp"
#include "TimeUtils.hpp"

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <set>
#include <stdexcept>

namespace FS = std::filesystem;
using json = nlohmann::json;

namespace
{
    OperationEvent MakeEvent(OperationEventType Type, const std::string& JobId, JobStatus Status)
    {
        OperationEvent Event;
        Event.Type = Type;
        Event.JobId = JobId;
        Event.Status = Status;
        return Event;
    }

    void ValidatePairs(const std::vector<std::string>& Sources, const std::vector<std::string>& Dests)
    {
        if (Sources.empty())
        {
            throw std::invalid_argument("At least one source path is required");
        }
        if (Sources.size() != Dests.size())
        {
            throw std::invalid_argument("Source and destination lists differ in length: " + std::to_string(Sources.size()) + " vs " + std::to_string(Dests.size()));
        }
    }

    // One result for a whole directory unit
    FileResult Summarize(const ResultMap& Results)
    {
        size_t Failed = 0;
        bool Cancelled = false;
        const FileResult* FirstFailure = nullptr;
        for (const auto& [Path, Result] : Results)
        {
            if (Result.IsCancelled())
            {
                Cancelled = true;
            }
            else if (!Result.Success)
            {
                ++Failed;
                if (!FirstFailure)
                {
                    FirstFailure = &Result;
                }
            }
        }

        if (FirstFailure)
        {
            return FileResult::Failure(FirstFailure->Kind, std::to_string(Failed) + " of " + std::to_string(Results.size()) + " files failed, first: " + FirstFailure->Error);
        }
        if (Cancelled)
        {
            return FileResult::Cancelled();
        }
        return FileResult::Ok();
    }

    uint64_t SizeOf(const std::string& Path, bool IsDirectory)
    {
        std::error_code Ec;
        if (IsDirectory)
        {
            FileScanner Scanner;
            if (!Scanner.Scan(Path, true))
            {
                Log.Error("[OperationsManager] Size of " + Path + " is incomplete, some entries could not be read");
            }
            return Scanner.GetTotalSize();
        }
        uint64_t Size = FS::file_size(Path, Ec);
        return Ec ? 0 : Size;
    }

    // Bytes per file inside a directory unit, summed for the unit's progress
    class UnitProgress
    {
    public:
        uint64_t Update(const std::string& File, uint64_t Copied)
        {
            std::lock_guard<std::mutex> Lock(UnitMutex);
            uint64_t& Previous = PerFile[File];
            if (Copied > Previous)
            {
                Total += Copied - Previous;
                Previous = Copied;
            }
            return Total;
        }

    private:
        std::mutex UnitMutex;
        std::map<std::string, uint64_t> PerFile;
        uint64_t Total = 0;
    };

    json ToJson(const Job& Entry)
    {
        auto OptionalTime = [](const std::optional<std::chrono::system_clock::time_point>& Point) -> json
        {
                return Point ? json(FormatIso8601(*Point)) : json(nullptr);
        };

        json Out;
        Out["operation_id"] = Entry.Id;
        Out["operation_type"] = ToString(Entry.Type);
        Out["source_paths"] = Entry.SourcePaths;
        Out["dest_paths"] = Entry.DestPaths;
        Out["status"] = ToString(Entry.Status);
        Out["priority"] = static_cast<int>(Entry.Priority);
        Out["created_at"] = FormatIso8601(Entry.CreatedAt);
        Out["started_at"] = OptionalTime(Entry.StartedAt);
        Out["completed_at"] = OptionalTime(Entry.CompletedAt);
        Out["error"] = Entry.Error.empty() ? json(nullptr) : json(Entry.Error);
        Out["verify"] = Entry.Verify;
        Out["preserve_metadata"] = Entry.PreserveMetadata;
        Out["conflict_action"] = ToString(Entry.Conflict);
        Out["total_size"] = Entry.TotalSize;
        Out["processed_size"] = Entry.ProcessedSize;
        Out["total_files"] = Entry.TotalFiles;
        Out["processed_files"] = Entry.ProcessedFiles;
        Out["failed_files"] = Entry.FailedFiles;
        Out["skipped_files"] = Entry.SkippedFiles;
        return Out;
    }

    std::optional<std::chrono::system_clock::time_point> TimeField(const json& Entry, const char* Key)
    {
        auto It = Entry.find(Key);
        if (It == Entry.end() || !It->is_string())
        {
            return std::nullopt;
        }
        return ParseIso8601(It->get<std::string>());
    }

    // Throws json::exception on wrongly typed fields
    std::optional<Job> FromJson(const json& Entry)
    {
        std::optional<JobType> Type = ParseJobType(Entry.at("operation_type").get<std::string>());
        std::optional<JobStatus> Status = ParseJobStatus(Entry.at("status").get<std::string>());
        int PriorityValue = Entry.value("priority", static_cast<int>(JobPriority::Normal));
        if (!Type || !Status || PriorityValue < 0 || PriorityValue > 3)
        {
            return std::nullopt;
        }

        Job Loaded;
        Loaded.Id = Entry.at("operation_id").get<std::string>();
        Loaded.Type = *Type;
        Loaded.Status = *Status;
        Loaded.Priority = static_cast<JobPriority>(PriorityValue);
        Loaded.SourcePaths = Entry.at("source_paths").get<std::vector<std::string>>();
        Loaded.DestPaths = Entry.value("dest_paths", std::vector<std::string>());
        Loaded.CreatedAt = TimeField(Entry, "created_at").value_or(std::chrono::system_clock::time_point());
        Loaded.StartedAt = TimeField(Entry, "started_at");
        Loaded.CompletedAt = TimeField(Entry, "completed_at");

        auto ErrorIt = Entry.find("error");
        if (ErrorIt != Entry.end() && ErrorIt->is_string())
        {
            Loaded.Error = ErrorIt->get<std::string>();
        }
        Loaded.Verify = Entry.value("verify", false);
        Loaded.PreserveMetadata = Entry.value("preserve_metadata", true);
        Loaded.Conflict = ParseConflictAction(Entry.value("conflict_action", std::string("ask"))).value_or(ConflictAction::Ask);
        Loaded.TotalSize = Entry.value("total_size", uint64_t{ 0 });
        Loaded.ProcessedSize = Entry.value("processed_size", uint64_t{ 0 });
        Loaded.TotalFiles = Entry.value("total_files", Loaded.SourcePaths.size());
        Loaded.ProcessedFiles = Entry.value("processed_files", size_t{ 0 });
        Loaded.FailedFiles = Entry.value("failed_files", size_t{ 0 });
        Loaded.SkippedFiles = Entry.value("skipped_files", size_t{ 0 });
        return Loaded;
    }
}

const char* ToString(JobType Type)
{
    switch (Type)
    {
    case JobType::Copy:   return "copy";
    case JobType::Move:   return "move";
    case JobType::Delete: return "delete";
    case JobType::Verify: return "verify";
    default:              return "unknown";
    }
}

const char* ToString(JobStatus Status)
{
    switch (Status)
    {
    case JobStatus::Queued:     return "queued";
    case JobStatus::InProgress: return "in_progress";
    case JobStatus::Paused:     return "paused";
    case JobStatus::Completed:  return "completed";
    case JobStatus::Failed:     return "failed";
    case JobStatus::Cancelled:  return "cancelled";
    default:                    return "unknown";
    }
}

const char* ToString(JobPriority Priority)
{
    switch (Priority)
    {
    case JobPriority::Critical: return "critical";
    case JobPriority::High:     return "high";
    case JobPriority::Normal:   return "normal";
    case JobPriority::Low:      return "low";
    default:                    return "unknown";
    }
}

std::optional<JobType> ParseJobType(const std::string& Name)
{
    for (JobType Type : { JobType::Copy, JobType::Move, JobType::Delete, JobType::Verify })
    {
        if (Name == ToString(Type))
        {
            return Type;
        }
    }
    return std::nullopt;
}

std::optional<JobStatus> ParseJobStatus(const std::string& Name)
{
    for (JobStatus Status : { JobStatus::Queued, JobStatus::InProgress, JobStatus::Paused, JobStatus::Completed, JobStatus::Failed, JobStatus::Cancelled })
    {
        if (Name == ToString(Status))
        {
            return Status;
        }
    }
    return std::nullopt;
}

std::optional<JobPriority> ParseJobPriority(const std::string& Name)
{
    std::string Lower = Name;
    std::transform(Lower.begin(), Lower.end(), Lower.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });

    for (JobPriority Priority : { JobPriority::Critical, JobPriority::High, JobPriority::Normal, JobPriority::Low })
    {
        if (Lower == ToString(Priority) || Lower == std::to_string(static_cast<int>(Priority)))
        {
            return Priority;
        }
    }
    return std::nullopt;
}

OperationsManager::OperationsManager(FileCopier& Copier, FileMover& Mover, FileVerifier& Verifier, ProgressTracker& Tracker, ManagerSettings Settings)
    : Copier(Copier), Mover(Mover), Verifier(Verifier), Tracker(Tracker), Settings(std::move(Settings))
{
    Events.Start();
    if (this->Settings.AutoStart)
    {
        Start();
    }
}

OperationsManager::~OperationsManager()
{
    Shutdown(true);
    Events.Stop();
}

void OperationsManager::Start()
{
    std::lock_guard<std::mutex> Lock(JobsMutex);
    if (Started || Stopping)
    {
        return;
    }
    Started = true;

    size_t WorkerCount = std::max<size_t>(1, Settings.MaxConcurrentOperations);
    for (size_t i = 0; i < WorkerCount; ++i)
    {
        Workers.emplace_back(&OperationsManager::WorkerLoop, this);
    }
    Log.Info("[OperationsManager] Started " + std::to_string(WorkerCount) + " workers");
}

std::string OperationsManager::GenerateJobId()
{
    unsigned char Bytes[16];
    if (RAND_bytes(Bytes, sizeof(Bytes)) != 1)
    {
        throw std::runtime_error("Could not gather random bytes for a job id");
    }
    // Version 4, RFC 4122 variant
    Bytes[6] = static_cast<unsigned char>((Bytes[6] & 0x0F) | 0x40);
    Bytes[8] = static_cast<unsigned char>((Bytes[8] & 0x3F) | 0x80);

    std::ostringstream Stream;
    Stream << std::hex << std::setfill('0');
    for (size_t i = 0; i < sizeof(Bytes); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
        {
            Stream << '-';
        }
        Stream << std::setw(2) << static_cast<unsigned int>(Bytes[i]);
    }
    return Stream.str();
}

std::string OperationsManager::Enqueue(Job NewJob)
{
    NewJob.Id = GenerateJobId();
    NewJob.Status = JobStatus::Queued;
    NewJob.CreatedAt = std::chrono::system_clock::now();
    NewJob.TotalFiles = NewJob.SourcePaths.size();
    std::string Id = NewJob.Id;
    std::string Summary = std::string(ToString(NewJob.Type)) + " job " + Id + " (" + std::to_string(NewJob.TotalFiles) + " entries, priority " + ToString(NewJob.Priority) + ")";

    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        if (Stopping)
        {
            throw std::logic_error("OperationsManager is shut down");
        }
        PendingQueue.push({ static_cast<int>(NewJob.Priority), NextSequence++, Id });
        Jobs.emplace(Id, std::move(NewJob));
    }
    Jobs_CV.notify_one();

    Log.Info("[OperationsManager] Queued " + Summary);
    Events.Publish(MakeEvent(OperationEventType::JobQueued, Id, JobStatus::Queued));
    return Id;
}

std::string OperationsManager::QueueCopy(const std::vector<std::string>& Sources, const std::vector<std::string>& Dests, JobPriority Priority, bool Verify, bool PreserveMetadata, ConflictAction Conflict)
{
    ValidatePairs(Sources, Dests);
    Job NewJob;
    NewJob.Type = JobType::Copy;
    NewJob.SourcePaths = Sources;
    NewJob.DestPaths = Dests;
    NewJob.Priority = Priority;
    NewJob.Verify = Verify;
    NewJob.PreserveMetadata = PreserveMetadata;
    NewJob.Conflict = Conflict;
    return Enqueue(std::move(NewJob));
}

std::string OperationsManager::QueueMove(const std::vector<std::string>& Sources, const std::vector<std::string>& Dests, JobPriority Priority, bool Verify, bool PreserveMetadata, ConflictAction Conflict)
{
    ValidatePairs(Sources, Dests);
    Job NewJob;
    NewJob.Type = JobType::Move;
    NewJob.SourcePaths = Sources;
    NewJob.DestPaths = Dests;
    NewJob.Priority = Priority;
    NewJob.Verify = Verify;
    NewJob.PreserveMetadata = PreserveMetadata;
    NewJob.Conflict = Conflict;
    return Enqueue(std::move(NewJob));
}

std::string OperationsManager::QueueVerify(const std::vector<std::string>& Sources, const std::vector<std::string>& Dests, JobPriority Priority)
{
    ValidatePairs(Sources, Dests);
    Job NewJob;
    NewJob.Type = JobType::Verify;
    NewJob.SourcePaths = Sources;
    NewJob.DestPaths = Dests;
    NewJob.Priority = Priority;
    NewJob.Verify = true;
    return Enqueue(std::move(NewJob));
}

std::string OperationsManager::QueueDelete(const std::vector<std::string>& Paths, JobPriority Priority)
{
    if (Paths.empty())
    {
        throw std::invalid_argument("At least one path is required");
    }
    Job NewJob;
    NewJob.Type = JobType::Delete;
    NewJob.SourcePaths = Paths;
    NewJob.DestPaths.assign(Paths.size(), std::string());
    NewJob.Priority = Priority;
    return Enqueue(std::move(NewJob));
}

void OperationsManager::WorkerLoop()
{
    while (true)
    {
        Job Claimed;
        std::shared_ptr<TransferControl> Control;
        {
            std::unique_lock<std::mutex> Lock(JobsMutex);
            Jobs_CV.wait(Lock, [this] { return Stopping || !PendingQueue.empty(); });
            if (Stopping)
            {
                return;
            }

            QueueEntry Entry = PendingQueue.top();
            PendingQueue.pop();

            // Cancelled or cleared while it waited
            auto It = Jobs.find(Entry.JobId);
            if (It == Jobs.end() || It->second.Status != JobStatus::Queued)
            {
                continue;
            }

            It->second.Status = JobStatus::InProgress;
            It->second.StartedAt = std::chrono::system_clock::now();
            Control = std::make_shared<TransferControl>();
            Controls[Entry.JobId] = Control;
            Claimed = It->second;
        }

        Log.Info(std::string("[OperationsManager] Started ") + ToString(Claimed.Type) + " job " + Claimed.Id);
        Events.Publish(MakeEvent(OperationEventType::JobStarted, Claimed.Id, JobStatus::InProgress));

        std::optional<std::string> Failure;
        try
        {
            Execute(Claimed, *Control);
        }
        catch (const std::exception& e)
        {
            Failure = e.what();
        }
        Finish(Claimed.Id, Failure);
    }
}

void OperationsManager::Execute(const Job& Claimed, TransferControl& Control)
{
    std::vector<WorkItem> Items(Claimed.SourcePaths.size());
    for (size_t i = 0; i < Items.size(); ++i)
    {
        std::error_code Ec;
        Items[i].Source = Claimed.SourcePaths[i];
        Items[i].Dest = i < Claimed.DestPaths.size() ? Claimed.DestPaths[i] : std::string();
        Items[i].IsDirectory = FS::is_directory(Items[i].Source, Ec);
    }

    if (Claimed.Type == JobType::Copy || Claimed.Type == JobType::Move)
    {
        ResolveConflicts(Claimed, Items, Control);
    }

    std::vector<std::string> Keys;
    std::vector<uintmax_t> Sizes;
    uint64_t TotalSize = 0;
    std::set<std::string> UsedKeys;
    for (size_t i = 0; i < Items.size(); ++i)
    {
        WorkItem& Item = Items[i];
        Item.Key = Claimed.Type == JobType::Delete ? Item.Source : Item.Dest;
        // Repeated paths (a skipped duplicate, a path deleted twice) still get their own progress entry
        if (!UsedKeys.insert(Item.Key).second)
        {
            Item.Key += "#" + std::to_string(i + 1);
            UsedKeys.insert(Item.Key);
        }
        Item.Size = SizeOf(Item.Source, Item.IsDirectory);
        Keys.push_back(Item.Key);
        Sizes.push_back(Item.Size);
        TotalSize += Item.Size;
    }
    Tracker.StartOperation(Claimed.Id, Keys, Sizes);

    bool PausedBeforeTracking = false;
    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        auto It = Jobs.find(Claimed.Id);
        if (It != Jobs.end())
        {
            It->second.TotalSize = TotalSize;
            PausedBeforeTracking = It->second.Status == JobStatus::Paused;
        }
    }
    if (PausedBeforeTracking)
    {
        Tracker.PauseOperation(Claimed.Id);
    }

    for (const auto& Item : Items)
    {
        if (Item.Skipped || Item.Outcome)
        {
            RecordOutcome(Claimed.Id, Item);
        }
    }

    if (Claimed.Type == JobType::Copy)
    {
        CheckFreeSpace(Items);
    }

    switch (Claimed.Type)
    {
    case JobType::Copy:
    case JobType::Move:
        RunTransfers(Claimed, Items, Control);
        break;
    case JobType::Verify:
        RunVerify(Claimed, Items, Control);
        break;
    case JobType::Delete:
        RunDelete(Claimed, Items, Control);
        break;
    }
}

void OperationsManager::ResolveConflicts(const Job& Claimed, std::vector<WorkItem>& Items, TransferControl& Control)
{
    ConflictResolver Resolver(Claimed.Conflict, Settings.RenamePattern);
    {
        std::lock_guard<std::mutex> Lock(CallbackMutex);
        if (ConflictCallback)
        {
            Resolver.SetCallback(ConflictCallback);
        }
    }

    for (size_t i = 0; i < Items.size(); ++i)
    {
        WorkItem& Item = Items[i];
        // Directory trees merge into an existing destination
        if (Item.IsDirectory)
        {
            Resolver.Reserve(Item.Dest);
            continue;
        }
        if (Control.IsCancelled())
        {
            return;
        }

        // An earlier item of this job already writes here
        bool ClaimedInJob = Resolver.IsReserved(Item.Dest);
        std::error_code Ec;
        if (!ClaimedInJob && !FS::exists(Item.Dest, Ec))
        {
            Resolver.Reserve(Item.Dest);
            continue;
        }

        try
        {
            ConflictResolution Resolution = Resolver.Resolve(Item.Source, Item.Dest);
            switch (Resolution.Action)
            {
            case ConflictAction::Skip:
                Item.Skipped = true;
                Log.Info("[OperationsManager] Conflict, skipping: " + Item.Dest);
                break;
            case ConflictAction::Rename:
            {
                Log.Info("[OperationsManager] Conflict, renaming: " + Item.Dest + " -> " + Resolution.NewPath);
                Item.Dest = Resolution.NewPath;
                Resolver.Reserve(Item.Dest);
                std::lock_guard<std::mutex> Lock(JobsMutex);
                auto It = Jobs.find(Claimed.Id);
                if (It != Jobs.end() && i < It->second.DestPaths.size())
                {
                    It->second.DestPaths[i] = Resolution.NewPath;
                }
                break;
            }
            default:
                if (ClaimedInJob)
                {
                    Log.Error("[OperationsManager] Two items of job " + Claimed.Id + " target " + Item.Dest);
                    Item.Outcome = FileResult::Failure(FileErrorKind::ConflictUnresolved, "Destination is written by another item of the same job: " + Item.Dest);
                    break;
                }
                Log.Info("[OperationsManager] Conflict, overwriting: " + Item.Dest);
                Resolver.Reserve(Item.Dest);
                break;
            }
        }
        catch (const FileOperationError& e)
        {
            Item.Outcome = FileResult::Failure(e.GetKind(), e.what());
        }
        catch (const std::exception& e)
        {
            Item.Outcome = FileResult::Failure(FileErrorKind::ConflictUnresolved, std::string("Conflict resolution failed: ") + e.what());
        }
    }
}

void OperationsManager::CheckFreeSpace(const std::vector<WorkItem>& Items) const
{
    struct VolumeNeed
    {
        std::string Probe;
        uint64_t Required = 0;
    };
    std::map<uint64_t, VolumeNeed> Needs;

    for (const auto& Item : Items)
    {
        if (Item.Skipped || Item.Outcome)
        {
            continue;
        }
        std::optional<uint64_t> Device = PathUtils::GetDeviceId(PathUtils::NearestExistingPath(Item.Dest));
        if (!Device)
        {
            continue;
        }

        uint64_t Required = Item.Size;
        std::error_code Ec;
        if (!Item.IsDirectory && FS::is_regular_file(Item.Dest, Ec))
        {
            uint64_t Existing = FS::file_size(Item.Dest, Ec);
            Required -= Ec ? 0 : std::min(Existing, Required);
        }

        VolumeNeed& Need = Needs[*Device];
        Need.Probe = Item.Dest;
        Need.Required += Required;
    }

    for (const auto& [Device, Need] : Needs)
    {
        auto [Enough, FreeBytes] = FileCopier::CheckSpaceAvailable(Need.Probe, Need.Required);
        if (!Enough)
        {
            throw FileOperationError(FileErrorKind::DiskFull, "Insufficient space on destination volume: need " + ProgressTracker::FormatSize(Need.Required) + ", " + ProgressTracker::FormatSize(FreeBytes) + " free");
        }
    }
}

void OperationsManager::RunTransfers(const Job& Claimed, std::vector<WorkItem>& Items, TransferControl& Control)
{
    const std::string& JobId = Claimed.Id;
    CopyOptions Options;
    Options.PreserveMetadata = Claimed.PreserveMetadata;
    Options.Verify = Claimed.Verify;
    Options.Control = &Control;

    std::vector<std::pair<std::string, std::string>> FilePairs;
    std::map<std::string, WorkItem*> ByDest;
    for (auto& Item : Items)
    {
        if (Item.IsDirectory || Item.Skipped || Item.Outcome)
        {
            continue;
        }
        if (!ByDest.emplace(Item.Dest, &Item).second)
        {
            Item.Outcome = FileResult::Failure(FileErrorKind::ConflictUnresolved, "Destination is written by another item of the same job: " + Item.Dest);
            RecordOutcome(JobId, Item);
            continue;
        }
        FilePairs.emplace_back(Item.Source, Item.Dest);
    }

    BatchProgressCallback Progress = [this, &JobId, &ByDest](const std::string& Dest, uint64_t Copied, uint64_t Total)
    {
            auto It = ByDest.find(Dest);
            Tracker.UpdateFile(JobId, It != ByDest.end() ? It->second->Key : Dest, Copied);
            OperationEvent Event = MakeEvent(OperationEventType::FileProgress, JobId, JobStatus::InProgress);
            Event.Path = Dest;
            Event.Bytes = Copied;
            Event.Total = Total;
            Events.Publish(std::move(Event));
    };

    if (!FilePairs.empty())
    {
        ResultMap Results = Claimed.Type == JobType::Copy ? Copier.CopyFilesBatch(FilePairs, Progress, Options) : Mover.MoveFilesBatch(FilePairs, Progress, Options);
        for (auto& [Dest, Result] : Results)
        {
            auto It = ByDest.find(Dest);
            if (It != ByDest.end())
            {
                It->second->Outcome = std::move(Result);
                RecordOutcome(JobId, *It->second);
            }
        }
    }

    for (auto& Item : Items)
    {
        if (!Item.IsDirectory || Item.Skipped || Item.Outcome)
        {
            continue;
        }
        if (Control.IsCancelled())
        {
            Item.Outcome = FileResult::Cancelled();
            continue;
        }

        UnitProgress Unit;
        BatchProgressCallback UnitCallback = [this, &JobId, &Item, &Unit](const std::string& File, uint64_t Copied, uint64_t)
        {
                uint64_t UnitBytes = Unit.Update(File, Copied);
                Tracker.UpdateFile(JobId, Item.Key, UnitBytes);
                OperationEvent Event = MakeEvent(OperationEventType::FileProgress, JobId, JobStatus::InProgress);
                Event.Path = Item.Key;
                Event.Bytes = UnitBytes;
                Event.Total = Item.Size;
                Events.Publish(std::move(Event));
        };

        try
        {
            ResultMap Results = Claimed.Type == JobType::Copy ? Copier.CopyDirectory(Item.Source, Item.Dest, UnitCallback, Options) : Mover.MoveDirectory(Item.Source, Item.Dest, UnitCallback, Options);
            Item.Outcome = Summarize(Results);
        }
        catch (const FileOperationError& e)
        {
            Item.Outcome = FileResult::Failure(e.GetKind(), e.what());
        }
        RecordOutcome(JobId, Item);
    }
}

void OperationsManager::RunVerify(const Job& Claimed, std::vector<WorkItem>& Items, TransferControl& Control)
{
    std::vector<std::pair<std::string, std::string>> FilePairs;
    std::map<std::string, WorkItem*> ByDest;
    std::vector<WorkItem*> Repeated;
    for (auto& Item : Items)
    {
        if (Item.IsDirectory || Item.Outcome)
        {
            continue;
        }
        if (ByDest.emplace(Item.Dest, &Item).second)
        {
            FilePairs.emplace_back(Item.Source, Item.Dest);
        }
        else
        {
            Repeated.push_back(&Item);
        }
    }

    if (!FilePairs.empty() && Control.WaitIfPaused())
    {
        ResultMap Results = Verifier.VerifyBatch(FilePairs, Settings.VerifyWorkers);
        for (auto& [Dest, Result] : Results)
        {
            auto It = ByDest.find(Dest);
            if (It != ByDest.end())
            {
                It->second->Outcome = std::move(Result);
                RecordOutcome(Claimed.Id, *It->second);
            }
        }
    }

    // The batch result is keyed by destination, so a destination named twice is checked on its own
    for (WorkItem* Item : Repeated)
    {
        if (Control.IsCancelled() || !Control.WaitIfPaused())
        {
            Item->Outcome = FileResult::Cancelled();
            continue;
        }
        Item->Outcome = Verifier.VerifyCopy(Item->Source, Item->Dest);
        RecordOutcome(Claimed.Id, *Item);
    }

    for (auto& Item : Items)
    {
        if (!Item.IsDirectory || Item.Outcome)
        {
            continue;
        }
        if (Control.IsCancelled() || !Control.WaitIfPaused())
        {
            Item.Outcome = FileResult::Cancelled();
            continue;
        }

        std::error_code Ec;
        if (!FS::is_directory(Item.Dest, Ec))
        {
            Item.Outcome = FileResult::Failure(FileErrorKind::SourceNotFound, "Destination directory not found: " + Item.Dest);
        }
        else
        {
            try
            {
                Item.Outcome = Summarize(Verifier.CompareDirectories(Item.Source, Item.Dest, true, Settings.VerifyWorkers));
            }
            catch (const FileOperationError& e)
            {
                Item.Outcome = FileResult::Failure(e.GetKind(), e.what());
            }
        }
        RecordOutcome(Claimed.Id, Item);
    }
}

void OperationsManager::RunDelete(const Job& Claimed, std::vector<WorkItem>& Items, TransferControl& Control)
{
    for (auto& Item : Items)
    {
        if (Control.IsCancelled() || !Control.WaitIfPaused())
        {
            Item.Outcome = FileResult::Cancelled();
            continue;
        }

        std::error_code Ec;
        FS::file_status Status = FS::symlink_status(Item.Source, Ec);
        if (Ec || !FS::exists(Status))
        {
            Item.Outcome = FileResult::Failure(FileErrorKind::SourceNotFound, "Path not found: " + Item.Source);
            RecordOutcome(Claimed.Id, Item);
            continue;
        }

        if (FS::is_directory(Status))
        {
            FS::remove_all(Item.Source, Ec);
        }
        else
        {
            FS::remove(Item.Source, Ec);
        }

        if (Ec)
        {
            Item.Outcome = FileResult::Failure(ClassifyErrorCode(Ec), "Delete failed for " + Item.Source + ": " + Ec.message());
        }
        else
        {
            Log.Info("[OperationsManager] Deleted: " + Item.Source);
            Item.Outcome = FileResult::Ok();
        }
        RecordOutcome(Claimed.Id, Item);
    }
}

void OperationsManager::RecordOutcome(const std::string& JobId, const WorkItem& Item)
{
    OperationEvent Event = MakeEvent(OperationEventType::FileCompleted, JobId, JobStatus::InProgress);
    Event.Path = Item.Key;
    Event.Total = Item.Size;

    if (Item.Skipped)
    {
        Tracker.SkipFile(JobId, Item.Key);
        {
            std::lock_guard<std::mutex> Lock(JobsMutex);
            auto It = Jobs.find(JobId);
            if (It != Jobs.end())
            {
                ++It->second.ProcessedFiles;
                ++It->second.SkippedFiles;
                It->second.ProcessedSize += Item.Size;
            }
        }
        Event.Skipped = true;
        Events.Publish(std::move(Event));
        return;
    }

    // Cancelled files count as neither processed nor failed
    if (!Item.Outcome || Item.Outcome->IsCancelled())
    {
        return;
    }

    const FileResult& Result = *Item.Outcome;
    if (Result.Success)
    {
        Tracker.CompleteFile(JobId, Item.Key);
    }
    else
    {
        Tracker.CompleteFile(JobId, Item.Key, Result.Error);
        Log.Error("[OperationsManager] Job " + JobId + ": " + Item.Key + ": " + Result.Error);
    }

    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        auto It = Jobs.find(JobId);
        if (It != Jobs.end())
        {
            if (Result.Success)
            {
                ++It->second.ProcessedFiles;
                It->second.ProcessedSize += Item.Size;
            }
            else
            {
                ++It->second.FailedFiles;
            }
        }
    }

    Event.Bytes = Result.Success ? Item.Size : 0;
    Event.Success = Result.Success;
    Event.Error = Result.Error;
    Events.Publish(std::move(Event));
}

void OperationsManager::Finish(const std::string& JobId, const std::optional<std::string>& Failure)
{
    JobStatus FinalStatus = JobStatus::Completed;
    std::string Summary;
    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        Controls.erase(JobId);
        auto It = Jobs.find(JobId);
        if (It != Jobs.end())
        {
            Job& Finished = It->second;
            if (Finished.Status != JobStatus::Cancelled)
            {
                if (Failure)
                {
                    Finished.Status = JobStatus::Failed;
                    Finished.Error = *Failure;
                }
                else
                {
                    Finished.Status = JobStatus::Completed;
                }
            }
            Finished.CompletedAt = std::chrono::system_clock::now();
            FinalStatus = Finished.Status;
            Summary = std::to_string(Finished.FailedFiles) + "/" + std::to_string(Finished.TotalFiles) + " failed, " + std::to_string(Finished.SkippedFiles) + " skipped";
        }
    }
    JobDone_CV.notify_all();
    Tracker.CompleteOperation(JobId);

    if (FinalStatus == JobStatus::Failed)
    {
        Log.Error("[OperationsManager] Job " + JobId + " failed: " + *Failure);
    }
    else
    {
        Log.Info("[OperationsManager] Job " + JobId + " " + ToString(FinalStatus) + " (" + Summary + ")");
    }

    OperationEvent Event = MakeEvent(OperationEventType::JobFinished, JobId, FinalStatus);
    if (Failure)
    {
        Event.Success = false;
        Event.Error = *Failure;
    }
    Events.Publish(std::move(Event));

    if (Settings.AutoSaveHistory && !Settings.HistoryFile.empty() && !SaveHistory())
    {
        Log.Error("[OperationsManager] History was not saved after job " + JobId);
    }
}

bool OperationsManager::Pause(const std::string& JobId)
{
    std::shared_ptr<TransferControl> Control;
    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        auto It = Jobs.find(JobId);
        if (It == Jobs.end() || It->second.Status != JobStatus::InProgress)
        {
            return false;
        }
        It->second.Status = JobStatus::Paused;
        auto ControlIt = Controls.find(JobId);
        if (ControlIt != Controls.end())
        {
            Control = ControlIt->second;
        }
    }
    if (Control)
    {
        Control->Pause();
    }
    Tracker.PauseOperation(JobId);
    Log.Info("[OperationsManager] Paused job " + JobId);
    return true;
}

bool OperationsManager::Resume(const std::string& JobId)
{
    std::shared_ptr<TransferControl> Control;
    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        auto It = Jobs.find(JobId);
        if (It == Jobs.end() || It->second.Status != JobStatus::Paused)
        {
            return false;
        }
        It->second.Status = JobStatus::InProgress;
        auto ControlIt = Controls.find(JobId);
        if (ControlIt != Controls.end())
        {
            Control = ControlIt->second;
        }
    }
    Tracker.ResumeOperation(JobId);
    if (Control)
    {
        Control->Resume();
    }
    Log.Info("[OperationsManager] Resumed job " + JobId);
    return true;
}

bool OperationsManager::Cancel(const std::string& JobId)
{
    std::shared_ptr<TransferControl> Control;
    bool WasQueued = false;
    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        auto It = Jobs.find(JobId);
        if (It == Jobs.end())
        {
            return false;
        }
        Job& Target = It->second;
        if (Target.Status == JobStatus::Queued)
        {
            Target.Status = JobStatus::Cancelled;
            Target.CompletedAt = std::chrono::system_clock::now();
            WasQueued = true;
        }
        else if (Target.Status == JobStatus::InProgress)
        {
            Target.Status = JobStatus::Cancelled;
            auto ControlIt = Controls.find(JobId);
            if (ControlIt != Controls.end())
            {
                Control = ControlIt->second;
            }
        }
        else
        {
            return false;
        }
    }

    Log.Info("[OperationsManager] Cancelled job " + JobId);
    if (Control)
    {
        // The worker finishes the job once the in-flight file has been cleaned up
        Control->Cancel();
        return true;
    }

    JobDone_CV.notify_all();
    Events.Publish(MakeEvent(OperationEventType::JobFinished, JobId, JobStatus::Cancelled));
    if (WasQueued && Settings.AutoSaveHistory && !Settings.HistoryFile.empty() && !SaveHistory())
    {
        Log.Error("[OperationsManager] History was not saved after cancelling job " + JobId);
    }
    return true;
}

std::optional<Job> OperationsManager::GetJob(const std::string& JobId) const
{
    std::lock_guard<std::mutex> Lock(JobsMutex);
    auto It = Jobs.find(JobId);
    if (It == Jobs.end())
    {
        return std::nullopt;
    }
    return It->second;
}

std::vector<Job> OperationsManager::ListAll() const
{
    std::lock_guard<std::mutex> Lock(JobsMutex);
    std::vector<Job> Result;
    Result.reserve(Jobs.size());
    for (const auto& [Id, Entry] : Jobs)
    {
        Result.push_back(Entry);
    }
    return Result;
}

std::vector<Job> OperationsManager::ListActive() const
{
    std::lock_guard<std::mutex> Lock(JobsMutex);
    std::vector<Job> Result;
    for (const auto& [Id, Entry] : Jobs)
    {
        if (Entry.Status == JobStatus::InProgress || Entry.Status == JobStatus::Paused)
        {
            Result.push_back(Entry);
        }
    }
    return Result;
}

std::vector<Job> OperationsManager::ListQueued() const
{
    std::lock_guard<std::mutex> Lock(JobsMutex);
    std::vector<Job> Result;
    for (const auto& [Id, Entry] : Jobs)
    {
        if (Entry.Status == JobStatus::Queued)
        {
            Result.push_back(Entry);
        }
    }
    return Result;
}

std::optional<OperationProgress> OperationsManager::GetProgress(const std::string& JobId) const
{
    return Tracker.GetProgress(JobId);
}

size_t OperationsManager::ClearCompleted()
{
    std::vector<std::string> Removed;
    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        for (auto It = Jobs.begin(); It != Jobs.end();)
        {
            if (IsTerminal(It->second.Status) && Controls.count(It->first) == 0)
            {
                Removed.push_back(It->first);
                It = Jobs.erase(It);
            }
            else
            {
                ++It;
            }
        }
    }
    for (const auto& Id : Removed)
    {
        Tracker.RemoveOperation(Id);
    }
    return Removed.size();
}

bool OperationsManager::SaveHistory() const
{
    if (Settings.HistoryFile.empty())
    {
        return true;
    }

    std::lock_guard<std::mutex> HistoryLock(HistoryMutex);
    json Operations = json::array();
    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        for (const auto& [Id, Entry] : Jobs)
        {
            if (IsTerminal(Entry.Status) && Controls.count(Id) == 0)
            {
                Operations.push_back(ToJson(Entry));
            }
        }
    }

    json Document;
    Document["operations"] = std::move(Operations);
    Document["saved_at"] = FormatIso8601(std::chrono::system_clock::now());

    FS::path Target(Settings.HistoryFile);
    FS::path Temp = Target;
    Temp += ".tmp";

    std::error_code Ec;
    if (Target.has_parent_path())
    {
        FS::create_directories(Target.parent_path(), Ec);
    }

    {
        std::ofstream Out(Temp, std::ios::out | std::ios::trunc);
        if (!Out.is_open())
        {
            Log.Error("[OperationsManager] Cannot write history file: " + Temp.string());
            return false;
        }
        Out << Document.dump(2);
        Out.flush();
        if (!Out)
        {
            Log.Error("[OperationsManager] Failed writing history file: " + Temp.string());
            Out.close();
            FS::remove(Temp, Ec);
            return false;
        }
    }

    FS::rename(Temp, Target, Ec);
    if (Ec)
    {
        Log.Error("[OperationsManager] Cannot replace history file " + Target.string() + ": " + Ec.message());
        std::error_code Ignored;
        FS::remove(Temp, Ignored);
        return false;
    }
    return true;
}

bool OperationsManager::LoadHistory()
{
    if (Settings.HistoryFile.empty())
    {
        return true;
    }

    std::error_code Ec;
    if (!FS::exists(Settings.HistoryFile, Ec))
    {
        Log.Info("[OperationsManager] No history file yet: " + Settings.HistoryFile);
        return true;
    }

    std::ifstream In(Settings.HistoryFile);
    if (!In.is_open())
    {
        Log.Error("[OperationsManager] Cannot open history file: " + Settings.HistoryFile);
        return false;
    }

    json Document;
    try
    {
        Document = json::parse(In);
    }
    catch (const json::parse_error& e)
    {
        Log.Error(std::string("[OperationsManager] History file is not valid JSON: ") + e.what());
        return false;
    }

    const json* Entries = nullptr;
    if (Document.is_array())
    {
        Entries = &Document;
    }
    else if (Document.is_object() && Document.contains("operations") && Document["operations"].is_array())
    {
        Entries = &Document["operations"];
    }
    else
    {
        Log.Error("[OperationsManager] History file has no operations list: " + Settings.HistoryFile);
        return false;
    }

    size_t Loaded = 0;
    for (const auto& Entry : *Entries)
    {
        try
        {
            std::optional<Job> Restored = FromJson(Entry);
            if (!Restored || !IsTerminal(Restored->Status))
            {
                continue;
            }
            std::lock_guard<std::mutex> Lock(JobsMutex);
            if (Jobs.count(Restored->Id) == 0)
            {
                std::string Id = Restored->Id;
                Jobs.emplace(Id, std::move(*Restored));
                ++Loaded;
            }
        }
        catch (const json::exception& e)
        {
            Log.Error(std::string("[OperationsManager] Skipping malformed history entry: ") + e.what());
        }
    }

    Log.Info("[OperationsManager] Loaded " + std::to_string(Loaded) + " jobs from " + Settings.HistoryFile);
    return true;
}

void OperationsManager::Shutdown(bool Wait)
{
    std::vector<std::string> Resumed;
    std::vector<std::shared_ptr<TransferControl>> ResumedControls;
    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        Stopping = true;
        for (auto& [Id, Entry] : Jobs)
        {
            if (Entry.Status == JobStatus::Paused)
            {
                Entry.Status = JobStatus::InProgress;
                Resumed.push_back(Id);
                auto ControlIt = Controls.find(Id);
                if (ControlIt != Controls.end())
                {
                    ResumedControls.push_back(ControlIt->second);
                }
            }
        }
    }
    Jobs_CV.notify_all();

    for (const auto& Id : Resumed)
    {
        Tracker.ResumeOperation(Id);
    }
    for (const auto& Control : ResumedControls)
    {
        Control->Resume();
    }

    if (Wait)
    {
        for (std::thread& Worker : Workers)
        {
            if (Worker.joinable())
            {
                Worker.join();
            }
        }
        Events.Flush();
    }

    if (!Settings.HistoryFile.empty() && !SaveHistory())
    {
        Log.Error("[OperationsManager] History was not saved at shutdown");
    }
}

void OperationsManager::SetConflictCallback(ConflictResolver::AskCallback Callback)
{
    std::lock_guard<std::mutex> Lock(CallbackMutex);
    ConflictCallback = std::move(Callback);
}

void OperationsManager::Subscribe(EventListener Listener)
{
    Events.Subscribe(std::move(Listener));
}

bool OperationsManager::WaitForJob(const std::string& JobId, std::chrono::milliseconds Timeout)
{
    std::unique_lock<std::mutex> Lock(JobsMutex);
    return JobDone_CV.wait_for(Lock, Timeout, [this, &JobId]
    {
            auto It = Jobs.find(JobId);
            return It == Jobs.end() || (IsTerminal(It->second.Status) && Controls.count(JobId) == 0);
    });
}
