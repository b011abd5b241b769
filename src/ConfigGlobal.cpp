#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    std::string HistoryFile;
    std::string VerifyAlgorithm;
    std::string RenamePattern;
    std::string DefaultConflictAction;
    bool AutoSaveHistory;
    bool VerifyAfterCopy;

    unsigned short int MaxLogFiles;
    unsigned short int MaxConcurrentOperations;
    unsigned short int RetryAttempts;
    unsigned int RetryDelayMs;
    unsigned short int VerifyChunkSizeMB;
    unsigned short int CopyWorkers;
    unsigned short int VerifyWorkers;

    void InitializeDefaults()
    {
        ConfigFile = "FileOps.conf"; //Can be replaced by absolute path
        LogDir = "FileOps_Logs"; //Same as above
        HistoryFile = "FileOps_History.json"; //Empty string disables history persistence
        VerifyAlgorithm = "md5";
        RenamePattern = "{stem} ({counter}){suffix}";
        DefaultConflictAction = "ask";
        AutoSaveHistory = true;
        VerifyAfterCopy = false;
        MaxLogFiles = 10;
        MaxConcurrentOperations = 2;
        RetryAttempts = 3;
        RetryDelayMs = 1000;
        VerifyChunkSizeMB = 64;
        CopyWorkers = 0; //0 = size the I/O pool from the CPU count
        VerifyWorkers = 0; //0 = size the hashing pool from the CPU count
    }
}
