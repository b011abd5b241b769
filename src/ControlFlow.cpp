#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include <getopt.h>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"
#include "FileCopier.hpp"
#include "FileHasher.hpp"
#include "FileMover.hpp"
#include "FileVerifier.hpp"
#include "Logger.hpp"
#include "ProgressTracker.hpp"
#include "TimeUtils.hpp"

namespace FS = std::filesystem;

namespace
{
    std::mutex ConsoleMutex;

    constexpr int ExitOk = 0;
    constexpr int ExitFailures = 1;
    constexpr int ExitUsage = 2;

    void PrintLine(std::ostream& Stream, const std::string& Line)
    {
        std::lock_guard<std::mutex> Lock(ConsoleMutex);
        Stream << Line << "\n";
    }

    void PrintFailures(const ResultMap& Results, const std::string& Label)
    {
        size_t Failed = 0;
        for (const auto& [Key, Result] : Results)
        {
            if (!Result.Success)
            {
                ++Failed;
                PrintLine(std::cerr, "FAILED " + Key + ": " + Result.Error);
            }
        }
        PrintLine(std::cout, std::to_string(Failed) + "/" + std::to_string(Results.size()) + " " + Label + " failed");
    }
}

void ControlFlow::PrintUsage(const char* Program)
{
    std::cerr << "Usage: " << Program << " [OPTIONS] COMMAND [ARGS...]\n"
        "\n"
        "Commands:\n"
        "  copy SRC... DEST               Copy files or directories\n"
        "  move SRC... DEST               Move files or directories\n"
        "  verify SRC DEST                Compare a copy against its source\n"
        "  delete PATH...                 Delete files or directory trees\n"
        "  checksum-create OUT FILE...    Write a checksum manifest\n"
        "  checksum-verify FILE           Check files against a manifest\n"
        "  history                        List finished jobs\n"
        "\n"
        "Options:\n"
        "  -c, --config FILE        Config file (default: " << ConfigGlobal::ConfigFile << ")\n"
        "  -p, --priority LEVEL     critical, high, normal or low (default: normal)\n"
        "  -a, --conflict ACTION    skip, overwrite, overwrite_older, rename or ask\n"
        "  -V, --verify             Verify every file after it is written\n"
        "  -n, --no-preserve        Do not copy timestamps and permissions\n"
        "  -h, --help               Show this help\n";
}

bool ControlFlow::ParseArguments(int argc, char** argv, CommandLine& Out)
{
    static struct option LongOptions[] = { {"config", required_argument, nullptr, 'c'},
                                           {"priority", required_argument, nullptr, 'p'},
                                           {"conflict", required_argument, nullptr, 'a'},
                                           {"verify", no_argument, nullptr, 'V'},
                                           {"no-preserve", no_argument, nullptr, 'n'},
                                           {"help", no_argument, nullptr, 'h'},
                                           {nullptr, 0, nullptr, 0} };

    // Stop at the first non-option so the command's own arguments are left alone
    optind = 1;
    int Opt;
    while ((Opt = getopt_long(argc, argv, "+c:p:a:Vnh", LongOptions, nullptr)) != -1)
    {
        switch (Opt)
        {
        case 'c':
            Out.ConfigFile = optarg;
            break;
        case 'p':
        {
            std::optional<JobPriority> Priority = ParseJobPriority(optarg);
            if (!Priority)
            {
                std::cerr << "fileops: invalid priority: " << optarg << "\n";
                return false;
            }
            Out.Priority = *Priority;
            break;
        }
        case 'a':
            Out.Conflict = ParseConflictAction(optarg);
            if (!Out.Conflict)
            {
                std::cerr << "fileops: invalid conflict action: " << optarg << "\n";
                return false;
            }
            break;
        case 'V':
            Out.Verify = true;
            break;
        case 'n':
            Out.PreserveMetadata = false;
            break;
        case 'h':
            PrintUsage(argv[0]);
            std::exit(ExitOk);
        default:
            return false;
        }
    }

    if (optind >= argc)
    {
        std::cerr << "fileops: expected a command\n";
        return false;
    }
    Out.Command = argv[optind];
    for (int i = optind + 1; i < argc; ++i)
    {
        Out.Arguments.push_back(argv[i]);
    }

    size_t Count = Out.Arguments.size();
    bool Valid = true;
    if (Out.Command == "copy" || Out.Command == "move")
    {
        Valid = Count >= 2;
    }
    else if (Out.Command == "verify")
    {
        Valid = Count == 2;
    }
    else if (Out.Command == "delete" || Out.Command == "checksum-verify")
    {
        Valid = Out.Command == "delete" ? Count >= 1 : Count == 1;
    }
    else if (Out.Command == "checksum-create")
    {
        Valid = Count >= 2;
    }
    else if (Out.Command == "history")
    {
        Valid = Count == 0;
    }
    else
    {
        std::cerr << "fileops: unknown command: " << Out.Command << "\n";
        return false;
    }

    if (!Valid)
    {
        std::cerr << "fileops: wrong number of arguments for " << Out.Command << "\n";
    }
    return Valid;
}

bool ControlFlow::LoadConfig(const CommandLine& Cmd)
{
    if (Cmd.ConfigFile)
    {
        ConfigGlobal::ConfigFile = *Cmd.ConfigFile;
    }

    std::error_code Ec;
    bool Present = FS::exists(ConfigGlobal::ConfigFile, Ec);
    if (!Present && !Cmd.ConfigFile)
    {
        // Running without a config file is fine; an explicit -c must exist
        return true;
    }

    if (!Parser.Parse(ConfigGlobal::ConfigFile))
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
        }
        std::cerr << "Check Errors and Fix Them, Exiting\n";
        return false;
    }
    return true;
}

int ControlFlow::Run(int argc, char** argv)
{
    CommandLine Cmd;
    if (!ParseArguments(argc, argv, Cmd))
    {
        PrintUsage(argv[0]);
        return ExitUsage;
    }

    if (!LoadConfig(Cmd))
    {
        return ExitUsage;
    }

    Log.Init(ConfigGlobal::LogDir);
    Log.CleanupOldLogs();
    Log.Info("Config: " + ConfigGlobal::ConfigFile);
    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info(Info);
    }

    HashAlgorithm Algorithm = ParseHashAlgorithm(ConfigGlobal::VerifyAlgorithm).value_or(HashAlgorithm::MD5);
    FileVerifier Verifier(Algorithm, static_cast<size_t>(ConfigGlobal::VerifyChunkSizeMB) * FileCopier::MB);

    if (Cmd.Command == "checksum-create")
    {
        return RunChecksumCreate(Cmd, Verifier);
    }
    if (Cmd.Command == "checksum-verify")
    {
        return RunChecksumVerify(Cmd, Verifier);
    }

    FileCopier Copier(ConfigGlobal::CopyWorkers, &Verifier, ConfigGlobal::RetryAttempts, std::chrono::milliseconds(ConfigGlobal::RetryDelayMs));
    FileMover Mover(Copier, &Verifier, ConfigGlobal::VerifyAfterCopy, true);
    ProgressTracker Tracker;

    ManagerSettings Settings;
    Settings.MaxConcurrentOperations = ConfigGlobal::MaxConcurrentOperations;
    Settings.HistoryFile = ConfigGlobal::HistoryFile;
    Settings.AutoSaveHistory = ConfigGlobal::AutoSaveHistory;
    Settings.RenamePattern = ConfigGlobal::RenamePattern;
    Settings.VerifyWorkers = ConfigGlobal::VerifyWorkers;

    OperationsManager Manager(Copier, Mover, Verifier, Tracker, Settings);
    if (!Manager.LoadHistory())
    {
        std::cerr << "History file could not be read, starting with an empty history: " << ConfigGlobal::HistoryFile << "\n";
    }

    if (Cmd.Command == "history")
    {
        return RunHistory(Manager);
    }

    Manager.SetConflictCallback(&ControlFlow::AskUser);
    Manager.Subscribe([](const OperationEvent& Event)
    {
            if (Event.Type != OperationEventType::FileCompleted)
            {
                return;
            }
            if (Event.Skipped)
            {
                PrintLine(std::cout, "SKIPPED " + Event.Path);
            }
            else if (Event.Success)
            {
                PrintLine(std::cout, "OK " + Event.Path);
            }
            else
            {
                PrintLine(std::cerr, "FAILED " + Event.Path + ": " + Event.Error);
            }
    });

    int Result = RunJob(Cmd, Manager);
    std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    return Result;
}

std::vector<std::string> ControlFlow::ExpandDestinations(const std::vector<std::string>& Sources, const std::string& Dest)
{
    std::error_code Ec;
    bool IntoDirectory = Sources.size() > 1 || FS::is_directory(Dest, Ec);

    std::vector<std::string> Dests;
    for (const auto& Source : Sources)
    {
        if (!IntoDirectory)
        {
            Dests.push_back(Dest);
            continue;
        }
        // "dir/" has an empty filename
        FS::path Normalized = FS::path(Source).lexically_normal();
        FS::path Name = Normalized.has_filename() ? Normalized.filename() : Normalized.parent_path().filename();
        Dests.push_back((FS::path(Dest) / Name).string());
    }
    return Dests;
}

int ControlFlow::RunJob(const CommandLine& Cmd, OperationsManager& Manager)
{
    ConflictAction Conflict = Cmd.Conflict.value_or(ParseConflictAction(ConfigGlobal::DefaultConflictAction).value_or(ConflictAction::Ask));
    bool Verify = Cmd.Verify || ConfigGlobal::VerifyAfterCopy;

    std::string JobId;
    try
    {
        if (Cmd.Command == "copy" || Cmd.Command == "move")
        {
            std::vector<std::string> Sources(Cmd.Arguments.begin(), Cmd.Arguments.end() - 1);
            std::vector<std::string> Dests = ExpandDestinations(Sources, Cmd.Arguments.back());
            JobId = Cmd.Command == "copy"
                ? Manager.QueueCopy(Sources, Dests, Cmd.Priority, Verify, Cmd.PreserveMetadata, Conflict)
                : Manager.QueueMove(Sources, Dests, Cmd.Priority, Verify, Cmd.PreserveMetadata, Conflict);
        }
        else if (Cmd.Command == "verify")
        {
            JobId = Manager.QueueVerify({ Cmd.Arguments[0] }, { Cmd.Arguments[1] }, Cmd.Priority);
        }
        else
        {
            JobId = Manager.QueueDelete(Cmd.Arguments, Cmd.Priority);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "fileops: " << e.what() << "\n";
        return ExitUsage;
    }

    PrintLine(std::cout, "Job " + JobId + " queued");

    while (!Manager.WaitForJob(JobId, std::chrono::milliseconds(1000)))
    {
        std::optional<OperationProgress> Progress = Manager.GetProgress(JobId);
        if (!Progress)
        {
            continue;
        }
        char Percent[16];
        std::snprintf(Percent, sizeof(Percent), "%5.1f%%", Progress->PercentComplete());
        PrintLine(std::cout, std::string(Percent) + "  " + ProgressTracker::FormatSize(Progress->CopiedSize()) + " / " + ProgressTracker::FormatSize(Progress->TotalSize)
            + "  " + ProgressTracker::FormatSpeed(Progress->CurrentSpeed()) + "  ETA " + ProgressTracker::FormatTime(Progress->EtaSeconds()) + (Progress->Paused ? "  [paused]" : ""));
    }

    std::optional<Job> Finished = Manager.GetJob(JobId);
    if (!Finished)
    {
        return ExitFailures;
    }

    PrintLine(std::cout, std::to_string(Finished->FailedFiles) + "/" + std::to_string(Finished->TotalFiles) + " files failed"
        + (Finished->SkippedFiles ? ", " + std::to_string(Finished->SkippedFiles) + " skipped" : std::string()));
    if (Finished->Status == JobStatus::Failed)
    {
        PrintLine(std::cerr, "Job failed: " + Finished->Error);
        return ExitFailures;
    }
    return Finished->Status == JobStatus::Completed && Finished->FailedFiles == 0 ? ExitOk : ExitFailures;
}

int ControlFlow::RunChecksumCreate(const CommandLine& Cmd, const FileVerifier& Verifier)
{
    std::vector<std::string> Files(Cmd.Arguments.begin() + 1, Cmd.Arguments.end());
    try
    {
        Verifier.GenerateChecksumFile(Files, Cmd.Arguments[0]);
    }
    catch (const FileOperationError& e)
    {
        std::cerr << "fileops: " << e.what() << "\n";
        Log.Error(std::string("[ControlFlow] ") + e.what());
        return ExitFailures;
    }
    std::cout << "Wrote " << ToString(Verifier.GetAlgorithm()) << " checksums for " << Files.size() << " files to " << Cmd.Arguments[0] << "\n";
    return ExitOk;
}

int ControlFlow::RunChecksumVerify(const CommandLine& Cmd, const FileVerifier& Verifier)
{
    ResultMap Results;
    try
    {
        Results = Verifier.VerifyChecksumFile(Cmd.Arguments[0]);
    }
    catch (const FileOperationError& e)
    {
        std::cerr << "fileops: " << e.what() << "\n";
        Log.Error(std::string("[ControlFlow] ") + e.what());
        return ExitFailures;
    }

    PrintFailures(Results, "files");
    bool AllOk = std::all_of(Results.begin(), Results.end(), [](const auto& Entry) { return Entry.second.Success; });
    return AllOk ? ExitOk : ExitFailures;
}

int ControlFlow::RunHistory(const OperationsManager& Manager)
{
    std::vector<Job> Jobs = Manager.ListAll();
    std::sort(Jobs.begin(), Jobs.end(), [](const Job& A, const Job& B) { return A.CreatedAt < B.CreatedAt; });

    for (const auto& Entry : Jobs)
    {
        std::string Line = FormatIso8601(Entry.CreatedAt) + "  " + Entry.Id + "  " + ToString(Entry.Type) + "  " + ToString(Entry.Status)
            + "  " + std::to_string(Entry.ProcessedFiles) + "/" + std::to_string(Entry.TotalFiles) + " files, " + std::to_string(Entry.FailedFiles) + " failed, "
            + ProgressTracker::FormatSize(Entry.ProcessedSize);
        if (!Entry.Error.empty())
        {
            Line += "  (" + Entry.Error + ")";
        }
        std::cout << Line << "\n";
    }
    std::cout << Jobs.size() << " jobs in history\n";
    return ExitOk;
}

ConflictResolution ControlFlow::AskUser(const std::string& Source, const std::string& Dest)
{
    ConflictInfo Info = ConflictResolver::GetConflictInfo(Source, Dest);

    std::lock_guard<std::mutex> Lock(ConsoleMutex);
    std::cout << "Destination exists: " << Dest << "\n"
        << "  source " << ProgressTracker::FormatSize(Info.SourceSize) << (Info.SourceNewer ? " (newer)" : "")
        << ", destination " << ProgressTracker::FormatSize(Info.DestSize) << "\n";

    std::string Input;
    while (true)
    {
        std::cout << "[s]kip, [o]verwrite, overwrite if [n]ewer, [r]ename (capital letter applies to all): " << std::flush;
        if (!std::getline(std::cin, Input))
        {
            ConflictResolution Resolution;
            Resolution.Action = ConflictAction::Skip;
            return Resolution;
        }
        if (Input.size() != 1)
        {
            continue;
        }

        ConflictResolution Resolution;
        Resolution.ApplyToAll = std::isupper(static_cast<unsigned char>(Input[0])) != 0;
        switch (std::tolower(static_cast<unsigned char>(Input[0])))
        {
        case 's': Resolution.Action = ConflictAction::Skip; return Resolution;
        case 'o': Resolution.Action = ConflictAction::Overwrite; return Resolution;
        case 'n': Resolution.Action = ConflictAction::OverwriteIfNewer; return Resolution;
        case 'r': Resolution.Action = ConflictAction::Rename; return Resolution;
        default:
            std::cout << "Invalid input.\n";
            break;
        }
    }
}
