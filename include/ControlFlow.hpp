#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ConfigParser.hpp"
#include "ConflictResolver.hpp"
#include "OperationsManager.hpp"

class FileVerifier;

// Command line front end: parses arguments, loads the config and drives one command through the manager
class ControlFlow
{
public:
    ControlFlow() = default;

    // 0 = every file succeeded, 1 = failures, 2 = usage or config error
    int Run(int argc, char** argv);

private:
    struct CommandLine
    {
        std::optional<std::string> ConfigFile;
        JobPriority Priority = JobPriority::Normal;
        std::optional<ConflictAction> Conflict;
        bool Verify = false;
        bool PreserveMetadata = true;
        std::string Command;
        std::vector<std::string> Arguments;
    };

    ConfigParser Parser;

    bool ParseArguments(int argc, char** argv, CommandLine& Out);
    bool LoadConfig(const CommandLine& Cmd);
    static void PrintUsage(const char* Program);

    int RunJob(const CommandLine& Cmd, OperationsManager& Manager);
    int RunChecksumCreate(const CommandLine& Cmd, const FileVerifier& Verifier);
    int RunChecksumVerify(const CommandLine& Cmd, const FileVerifier& Verifier);
    int RunHistory(const OperationsManager& Manager);

    // SRC... DEST expands to one destination per source
    static std::vector<std::string> ExpandDestinations(const std::vector<std::string>& Sources, const std::string& Dest);
    static ConflictResolution AskUser(const std::string& Source, const std::string& Dest);
};
