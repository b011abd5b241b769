#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using ProgressClock = std::chrono::steady_clock;

struct FileProgress
{
    std::string Path;
    uintmax_t Size = 0;
    uintmax_t Copied = 0;
    ProgressClock::time_point StartTime = ProgressClock::now();
    std::optional<ProgressClock::time_point> EndTime;
    double Speed = 0.0;         // bytes per second since StartTime
    std::optional<std::string> Error;
    bool Skipped = false;

    double PercentComplete() const;
    double ElapsedSeconds() const;
    std::optional<double> EtaSeconds() const;

    // Copied never moves backwards
    void Update(uintmax_t BytesCopied);
    void Complete(const std::optional<std::string>& FailureMessage = std::nullopt);
};

struct OperationProgress
{
    static constexpr size_t MaxSpeedSamples = 10;
    static constexpr double SampleIntervalSeconds = 0.5;

    std::string OperationId;
    size_t TotalFiles = 0;
    uintmax_t TotalSize = 0;
    std::map<std::string, FileProgress> Files;

    ProgressClock::time_point StartTime = ProgressClock::now();
    std::optional<ProgressClock::time_point> EndTime;
    bool Paused = false;
    std::optional<ProgressClock::time_point> PauseTime;
    ProgressClock::duration TotalPauseDuration{ 0 };

    std::deque<double> SpeedSamples;
    uintmax_t LastBytes = 0;
    ProgressClock::time_point LastUpdate = ProgressClock::now();

    size_t CompletedFiles() const;
    size_t FailedFiles() const;
    size_t SkippedFiles() const;
    uintmax_t CopiedSize() const;
    double PercentComplete() const;

    // Rolling average over the last samples
    double CurrentSpeed() const;
    double AverageSpeed() const;
    // Wall time minus every paused interval
    double ElapsedSeconds() const;
    // Rolling speed, falling back to the average speed
    std::optional<double> EtaSeconds() const;

    void UpdateSpeed();
    void Pause();
    void Resume();
    void Complete();
};

// Thread safe registry of per-operation progress, guarded by its own lock.
// Readers get copies, never references into the registry.
class ProgressTracker
{
public:
    ProgressTracker() = default;

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void StartOperation(const std::string& OperationId, const std::vector<std::string>& Files, const std::vector<uintmax_t>& Sizes);
    void UpdateFile(const std::string& OperationId, const std::string& FilePath, uintmax_t BytesCopied);
    void CompleteFile(const std::string& OperationId, const std::string& FilePath, const std::optional<std::string>& Error = std::nullopt);
    // Counts the file as done without any bytes moved
    void SkipFile(const std::string& OperationId, const std::string& FilePath);

    std::optional<OperationProgress> GetProgress(const std::string& OperationId) const;
    std::optional<FileProgress> GetFileProgress(const std::string& OperationId, const std::string& FilePath) const;
    std::map<std::string, OperationProgress> GetAllOperations() const;

    void PauseOperation(const std::string& OperationId);
    void ResumeOperation(const std::string& OperationId);
    void CompleteOperation(const std::string& OperationId);
    void RemoveOperation(const std::string& OperationId);

    std::vector<double> GetSpeedGraphData(const std::string& OperationId, size_t MaxPoints = 60) const;

    static std::string FormatTime(std::optional<double> Seconds);
    static std::string FormatSpeed(double BytesPerSecond);
    static std::string FormatSize(uintmax_t SizeBytes);

private:
    mutable std::mutex TrackerMutex;
    std::map<std::string, OperationProgress> Operations;
};
