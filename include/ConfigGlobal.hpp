#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern std::string HistoryFile;
    extern std::string VerifyAlgorithm;
    extern std::string RenamePattern;
    extern std::string DefaultConflictAction;
    extern bool AutoSaveHistory;
    extern bool VerifyAfterCopy;

    extern unsigned short int MaxLogFiles;
    extern unsigned short int MaxConcurrentOperations;
    extern unsigned short int RetryAttempts;
    extern unsigned int RetryDelayMs;
    extern unsigned short int VerifyChunkSizeMB;
    extern unsigned short int CopyWorkers;
    extern unsigned short int VerifyWorkers;

    void InitializeDefaults();
}
