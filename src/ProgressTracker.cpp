#include "ProgressTracker.hpp"

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace
{
    double ToSeconds(ProgressClock::duration Duration)
    {
        return std::chrono::duration<double>(Duration).count();
    }

    std::string Fixed(double Value, int Precision)
    {
        std::ostringstream Stream;
        Stream << std::fixed << std::setprecision(Precision) << Value;
        return Stream.str();
    }
}

double FileProgress::PercentComplete() const
{
    return Size > 0 ? static_cast<double>(Copied) / static_cast<double>(Size) * 100.0 : 0.0;
}

double FileProgress::ElapsedSeconds() const
{
    ProgressClock::time_point End = EndTime ? *EndTime : ProgressClock::now();
    return ToSeconds(End - StartTime);
}

std::optional<double> FileProgress::EtaSeconds() const
{
    if (Speed <= 0.0 || Copied >= Size)
    {
        return std::nullopt;
    }
    return static_cast<double>(Size - Copied) / Speed;
}

void FileProgress::Update(uintmax_t BytesCopied)
{
    if (EndTime || BytesCopied < Copied)
    {
        return;
    }
    Copied = BytesCopied;
    double Elapsed = ElapsedSeconds();
    if (Elapsed > 0.0)
    {
        Speed = static_cast<double>(Copied) / Elapsed;
    }
}

void FileProgress::Complete(const std::optional<std::string>& FailureMessage)
{
    EndTime = ProgressClock::now();
    Error = FailureMessage;
    if (!FailureMessage)
    {
        Copied = Size;
    }
}

size_t OperationProgress::CompletedFiles() const
{
    return static_cast<size_t>(std::count_if(Files.begin(), Files.end(), [](const auto& Entry) { return Entry.second.EndTime.has_value(); }));
}

size_t OperationProgress::FailedFiles() const
{
    return static_cast<size_t>(std::count_if(Files.begin(), Files.end(), [](const auto& Entry) { return Entry.second.Error.has_value(); }));
}

size_t OperationProgress::SkippedFiles() const
{
    return static_cast<size_t>(std::count_if(Files.begin(), Files.end(), [](const auto& Entry) { return Entry.second.Skipped; }));
}

uintmax_t OperationProgress::CopiedSize() const
{
    uintmax_t Total = 0;
    for (const auto& [Path, File] : Files)
    {
        Total += File.Copied;
    }
    return Total;
}

double OperationProgress::PercentComplete() const
{
    return TotalSize > 0 ? static_cast<double>(CopiedSize()) / static_cast<double>(TotalSize) * 100.0 : 0.0;
}

double OperationProgress::CurrentSpeed() const
{
    if (SpeedSamples.empty())
    {
        return 0.0;
    }
    return std::accumulate(SpeedSamples.begin(), SpeedSamples.end(), 0.0) / static_cast<double>(SpeedSamples.size());
}

double OperationProgress::AverageSpeed() const
{
    double Elapsed = ElapsedSeconds();
    return Elapsed > 0.0 ? static_cast<double>(CopiedSize()) / Elapsed : 0.0;
}

double OperationProgress::ElapsedSeconds() const
{
    ProgressClock::time_point End = EndTime ? *EndTime : ProgressClock::now();
    if (Paused && PauseTime)
    {
        End = *PauseTime;
    }
    return std::max(0.0, ToSeconds(End - StartTime - TotalPauseDuration));
}

std::optional<double> OperationProgress::EtaSeconds() const
{
    double Speed = CurrentSpeed();
    if (Speed <= 0.0)
    {
        Speed = AverageSpeed();
    }
    if (Speed <= 0.0)
    {
        return std::nullopt;
    }
    uintmax_t Copied = CopiedSize();
    uintmax_t Remaining = TotalSize > Copied ? TotalSize - Copied : 0;
    return static_cast<double>(Remaining) / Speed;
}

void OperationProgress::UpdateSpeed()
{
    ProgressClock::time_point Now = ProgressClock::now();
    double Elapsed = ToSeconds(Now - LastUpdate);
    if (Elapsed < SampleIntervalSeconds)
    {
        return;
    }

    uintmax_t CurrentBytes = CopiedSize();
    double BytesDiff = static_cast<double>(CurrentBytes) - static_cast<double>(LastBytes);
    SpeedSamples.push_back(std::max(0.0, BytesDiff) / Elapsed);
    while (SpeedSamples.size() > MaxSpeedSamples)
    {
        SpeedSamples.pop_front();
    }

    LastBytes = CurrentBytes;
    LastUpdate = Now;
}

void OperationProgress::Pause()
{
    if (!Paused)
    {
        Paused = true;
        PauseTime = ProgressClock::now();
    }
}

void OperationProgress::Resume()
{
    if (Paused && PauseTime)
    {
        ProgressClock::time_point Now = ProgressClock::now();
        TotalPauseDuration += Now - *PauseTime;
        Paused = false;
        PauseTime.reset();
        // The paused interval must not show up as a zero-speed sample
        LastUpdate = Now;
        LastBytes = CopiedSize();
    }
}

void OperationProgress::Complete()
{
    if (Paused)
    {
        Resume();
    }
    EndTime = ProgressClock::now();
}

void ProgressTracker::StartOperation(const std::string& OperationId, const std::vector<std::string>& Files, const std::vector<uintmax_t>& Sizes)
{
    OperationProgress Progress;
    Progress.OperationId = OperationId;
    Progress.TotalFiles = Files.size();

    for (size_t i = 0; i < Files.size(); ++i)
    {
        FileProgress File;
        File.Path = Files[i];
        File.Size = i < Sizes.size() ? Sizes[i] : 0;
        Progress.TotalSize += File.Size;
        Progress.Files[Files[i]] = std::move(File);
    }

    std::lock_guard<std::mutex> Lock(TrackerMutex);
    Operations[OperationId] = std::move(Progress);
}

void ProgressTracker::UpdateFile(const std::string& OperationId, const std::string& FilePath, uintmax_t BytesCopied)
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    auto Op = Operations.find(OperationId);
    if (Op == Operations.end())
    {
        return;
    }
    auto File = Op->second.Files.find(FilePath);
    if (File != Op->second.Files.end())
    {
        File->second.Update(BytesCopied);
        Op->second.UpdateSpeed();
    }
}

void ProgressTracker::CompleteFile(const std::string& OperationId, const std::string& FilePath, const std::optional<std::string>& Error)
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    auto Op = Operations.find(OperationId);
    if (Op == Operations.end())
    {
        return;
    }
    auto File = Op->second.Files.find(FilePath);
    if (File != Op->second.Files.end())
    {
        File->second.Complete(Error);
        Op->second.UpdateSpeed();
    }
}

void ProgressTracker::SkipFile(const std::string& OperationId, const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    auto Op = Operations.find(OperationId);
    if (Op == Operations.end())
    {
        return;
    }
    auto File = Op->second.Files.find(FilePath);
    if (File != Op->second.Files.end())
    {
        File->second.Skipped = true;
        File->second.Complete();
    }
}

std::optional<OperationProgress> ProgressTracker::GetProgress(const std::string& OperationId) const
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    auto Op = Operations.find(OperationId);
    if (Op == Operations.end())
    {
        return std::nullopt;
    }
    return Op->second;
}

std::optional<FileProgress> ProgressTracker::GetFileProgress(const std::string& OperationId, const std::string& FilePath) const
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    auto Op = Operations.find(OperationId);
    if (Op == Operations.end())
    {
        return std::nullopt;
    }
    auto File = Op->second.Files.find(FilePath);
    if (File == Op->second.Files.end())
    {
        return std::nullopt;
    }
    return File->second;
}

std::map<std::string, OperationProgress> ProgressTracker::GetAllOperations() const
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    return Operations;
}

void ProgressTracker::PauseOperation(const std::string& OperationId)
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    auto Op = Operations.find(OperationId);
    if (Op != Operations.end())
    {
        Op->second.Pause();
    }
}

void ProgressTracker::ResumeOperation(const std::string& OperationId)
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    auto Op = Operations.find(OperationId);
    if (Op != Operations.end())
    {
        Op->second.Resume();
    }
}

void ProgressTracker::CompleteOperation(const std::string& OperationId)
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    auto Op = Operations.find(OperationId);
    if (Op != Operations.end())
    {
        Op->second.Complete();
    }
}

void ProgressTracker::RemoveOperation(const std::string& OperationId)
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    Operations.erase(OperationId);
}

std::vector<double> ProgressTracker::GetSpeedGraphData(const std::string& OperationId, size_t MaxPoints) const
{
    std::lock_guard<std::mutex> Lock(TrackerMutex);
    auto Op = Operations.find(OperationId);
    if (Op == Operations.end())
    {
        return {};
    }
    const auto& Samples = Op->second.SpeedSamples;
    size_t Skip = Samples.size() > MaxPoints ? Samples.size() - MaxPoints : 0;
    return std::vector<double>(Samples.begin() + static_cast<std::ptrdiff_t>(Skip), Samples.end());
}

std::string ProgressTracker::FormatTime(std::optional<double> Seconds)
{
    if (!Seconds)
    {
        return "Unknown";
    }
    if (*Seconds < 60.0)
    {
        return Fixed(*Seconds, 0) + "s";
    }
    if (*Seconds < 3600.0)
    {
        return Fixed(*Seconds / 60.0, 1) + "m";
    }
    return Fixed(*Seconds / 3600.0, 1) + "h";
}

std::string ProgressTracker::FormatSpeed(double BytesPerSecond)
{
    constexpr double KB = 1024.0;
    if (BytesPerSecond < KB)
    {
        return Fixed(BytesPerSecond, 0) + " B/s";
    }
    if (BytesPerSecond < KB * KB)
    {
        return Fixed(BytesPerSecond / KB, 1) + " KB/s";
    }
    if (BytesPerSecond < KB * KB * KB)
    {
        return Fixed(BytesPerSecond / (KB * KB), 1) + " MB/s";
    }
    return Fixed(BytesPerSecond / (KB * KB * KB), 2) + " GB/s";
}

std::string ProgressTracker::FormatSize(uintmax_t SizeBytes)
{
    constexpr double KB = 1024.0;
    double Size = static_cast<double>(SizeBytes);
    if (SizeBytes < 1024)
    {
        return std::to_string(SizeBytes) + " B";
    }
    if (Size < KB * KB)
    {
        return Fixed(Size / KB, 1) + " KB";
    }
    if (Size < KB * KB * KB)
    {
        return Fixed(Size / (KB * KB), 1) + " MB";
    }
    return Fixed(Size / (KB * KB * KB), 2) + " GB";
}
