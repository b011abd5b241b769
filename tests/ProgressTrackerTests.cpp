#include "ProgressTracker.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace
{
    void Sleep(int Milliseconds)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(Milliseconds));
    }

    void TestFormatting(TestContext& T)
    {
        T.Check(ProgressTracker::FormatTime(std::nullopt) == "Unknown", "missing ETA should format as Unknown");
        T.Check(ProgressTracker::FormatTime(45.0) == "45s", "45 seconds should format as 45s");
        T.Check(ProgressTracker::FormatTime(90.0) == "1.5m", "90 seconds should format as 1.5m");
        T.Check(ProgressTracker::FormatTime(5400.0) == "1.5h", "5400 seconds should format as 1.5h");

        T.Check(ProgressTracker::FormatSpeed(512.0) == "512 B/s", "bytes per second, got " + ProgressTracker::FormatSpeed(512.0));
        T.Check(ProgressTracker::FormatSpeed(1536.0) == "1.5 KB/s", "KB per second, got " + ProgressTracker::FormatSpeed(1536.0));
        T.Check(ProgressTracker::FormatSpeed(2.5 * 1024 * 1024) == "2.5 MB/s", "MB per second");
        T.Check(ProgressTracker::FormatSpeed(3.0 * 1024 * 1024 * 1024) == "3.00 GB/s", "GB per second");

        T.Check(ProgressTracker::FormatSize(1023) == "1023 B", "bytes");
        T.Check(ProgressTracker::FormatSize(1024) == "1.0 KB", "kilobytes");
        T.Check(ProgressTracker::FormatSize(5ULL * 1024 * 1024) == "5.0 MB", "megabytes");
    }

    void TestFileProgressIsMonotonic(TestContext& T)
    {
        ProgressTracker Tracker;
        Tracker.StartOperation("op", { "a", "b" }, { 100, 300 });

        Tracker.UpdateFile("op", "a", 50);
        Tracker.UpdateFile("op", "a", 30);
        auto A = Tracker.GetFileProgress("op", "a");
        T.Check(A && A->Copied == 50, "copied bytes should never move backwards");
        T.Check(A && A->PercentComplete() == 50.0, "file percent should follow copied bytes");

        Tracker.CompleteFile("op", "a");
        Tracker.UpdateFile("op", "a", 10);
        A = Tracker.GetFileProgress("op", "a");
        T.Check(A && A->Copied == 100, "completed file should report its full size");

        Tracker.CompleteFile("op", "b", std::string("disk on fire"));
        auto Progress = Tracker.GetProgress("op");
        T.Check(Progress.has_value(), "operation should be tracked");
        if (Progress)
        {
            T.Check(Progress->TotalFiles == 2 && Progress->TotalSize == 400, "totals should be registered");
            T.Check(Progress->CompletedFiles() == 2, "both files should be complete");
            T.Check(Progress->FailedFiles() == 1, "one file should be failed");
            T.Check(Progress->CopiedSize() == 100, "failed file should keep its partial count");
            T.Check(Progress->PercentComplete() == 25.0, "operation percent should be 25");
        }
        T.Check(!Tracker.GetProgress("unknown").has_value(), "unknown operation should not be found");
    }

    void TestSkipCountsAsComplete(TestContext& T)
    {
        ProgressTracker Tracker;
        Tracker.StartOperation("op", { "a" }, { 42 });
        Tracker.SkipFile("op", "a");
        auto Progress = Tracker.GetProgress("op");
        T.Check(Progress && Progress->SkippedFiles() == 1, "skipped file should be counted");
        T.Check(Progress && Progress->CompletedFiles() == 1 && Progress->FailedFiles() == 0, "skipped file should be complete, not failed");
        T.Check(Progress && Progress->PercentComplete() == 100.0, "skipped file should count toward percent");
    }

    void TestElapsedExcludesPause(TestContext& T)
    {
        ProgressTracker Tracker;
        Tracker.StartOperation("op", { "a" }, { 1000 });
        Sleep(200);
        Tracker.PauseOperation("op");
        Sleep(400);
        auto Paused = Tracker.GetProgress("op");
        T.Check(Paused && Paused->Paused, "operation should report paused");
        T.Check(Paused && Paused->ElapsedSeconds() < 0.35, "elapsed should freeze while paused");
        Tracker.ResumeOperation("op");
        Sleep(100);

        auto Progress = Tracker.GetProgress("op");
        double Elapsed = Progress ? Progress->ElapsedSeconds() : -1.0;
        T.Check(Elapsed >= 0.25 && Elapsed < 0.55, "elapsed should exclude the paused 400ms, got " + std::to_string(Elapsed));

        Tracker.CompleteOperation("op");
        Progress = Tracker.GetProgress("op");
        T.Check(Progress && Progress->EndTime.has_value(), "completed operation should have an end time");
    }

    void TestRollingSpeed(TestContext& T)
    {
        ProgressTracker Tracker;
        Tracker.StartOperation("op", { "a" }, { 10000 });
        T.Check(!Tracker.GetProgress("op")->EtaSeconds().has_value(), "no ETA before any bytes move");

        Sleep(600);
        Tracker.UpdateFile("op", "a", 3000);
        auto Progress = Tracker.GetProgress("op");
        T.Check(Progress && Progress->CurrentSpeed() > 0.0, "a sample should be taken after the interval");
        T.Check(Progress && Progress->EtaSeconds().has_value(), "ETA should be known once speed is");

        // Within the sampling interval no new sample is added
        Tracker.UpdateFile("op", "a", 3500);
        T.Check(Tracker.GetSpeedGraphData("op").size() == 1, "updates inside the interval should not add samples");
        T.Check(Tracker.GetSpeedGraphData("op", 0).empty(), "graph data should respect the point limit");

        T.Check(Tracker.GetAllOperations().size() == 1, "one operation should be listed");
        Tracker.RemoveOperation("op");
        T.Check(Tracker.GetAllOperations().empty(), "removed operation should be gone");
    }
}

int main()
{
    TestContext T;
    TestFormatting(T);
    TestFileProgressIsMonotonic(T);
    TestSkipCountsAsComplete(T);
    TestElapsedExcludesPause(T);
    TestRollingSpeed(T);
    return T.Finish("progress_tracker_tests");
}
