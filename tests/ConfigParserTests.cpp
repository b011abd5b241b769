#include "ConfigGlobal.hpp"
#include "ConfigParser.hpp"
#include "TestSupport.hpp"

#include <string>

namespace
{
    void TestValidConfig(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("FileOps.conf"),
            "# comment line\n"
            "\n"
            "MaxConcurrentOperations = 4\n"
            "RetryAttempts=5\n"
            "RetryDelayMs = 250\n"
            "VerifyChunkSizeMB = 8\n"
            "VerifyAlgorithm = sha256\n"
            "DefaultConflictAction = overwrite_older\n"
            "RenamePattern = {stem}_{counter}{suffix}\n"
            "AutoSaveHistory = NO\n"
            "VerifyAfterCopy = YES\n"
            "HistoryFile =\n"
            "LogDir = " + Dir.File("logs") + "\n");

        ConfigParser Parser;
        Parser.Reset();
        T.Check(Parser.Parse(Dir.File("FileOps.conf")), "valid config should parse");
        T.Check(Parser.GetErrors().empty(), "valid config should report no errors");
        T.Check(ConfigGlobal::MaxConcurrentOperations == 4, "MaxConcurrentOperations");
        T.Check(ConfigGlobal::RetryAttempts == 5 && ConfigGlobal::RetryDelayMs == 250, "retry settings");
        T.Check(ConfigGlobal::VerifyChunkSizeMB == 8, "VerifyChunkSizeMB");
        T.Check(ConfigGlobal::VerifyAlgorithm == "sha256", "VerifyAlgorithm");
        T.Check(ConfigGlobal::DefaultConflictAction == "overwrite_older", "DefaultConflictAction");
        T.Check(ConfigGlobal::RenamePattern == "{stem}_{counter}{suffix}", "RenamePattern");
        T.Check(!ConfigGlobal::AutoSaveHistory && ConfigGlobal::VerifyAfterCopy, "YES/NO switches");
        T.Check(ConfigGlobal::HistoryFile.empty(), "empty HistoryFile disables persistence");
        T.Check(ConfigGlobal::LogDir == Dir.File("logs"), "LogDir");
        T.Check(!Parser.GetInfos().empty(), "accepted keys should be reported as infos");
    }

    void TestInvalidValues(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("FileOps.conf"),
            "MaxConcurrentOperations = 0\n"
            "RetryAttempts = three\n"
            "VerifyAlgorithm = sha1\n"
            "DefaultConflictAction = merge\n"
            "RenamePattern = {stem}-copy\n"
            "AutoSaveHistory = maybe\n"
            "NoEqualsHere\n"
            "Colour = blue\n"
            "CopyWorkers = 3\n");

        ConfigParser Parser;
        Parser.Reset();
        T.Check(!Parser.Parse(Dir.File("FileOps.conf")), "invalid config should fail");

        const auto& Errors = Parser.GetErrors();
        T.Check(Errors.size() == 8, "each bad line should report one error, got " + std::to_string(Errors.size()));
        std::string All;
        for (const auto& Error : Errors)
        {
            All += Error + "\n";
        }
        T.CheckContains(All, "Line 1: MaxConcurrentOperations must be between 1 and 64.", "range error");
        T.CheckContains(All, "Line 2: Invalid number for RetryAttempts.", "number error");
        T.CheckContains(All, "Invalid VerifyAlgorithm", "algorithm error");
        T.CheckContains(All, "Invalid DefaultConflictAction", "conflict action error");
        T.CheckContains(All, "RenamePattern must contain '{counter}'", "pattern error");
        T.CheckContains(All, "Use 'YES' or 'NO'", "switch error");
        T.CheckContains(All, "Invalid format on line 7", "format error");
        T.CheckContains(All, "Unknown key 'Colour'", "unknown key error");

        T.Check(ConfigGlobal::MaxConcurrentOperations == 2, "rejected values should keep the default");
        T.Check(ConfigGlobal::VerifyAlgorithm == "md5", "rejected algorithm should keep the default");
        T.Check(ConfigGlobal::CopyWorkers == 3, "valid lines still apply beside invalid ones");
    }

    void TestMissingFile(TestContext& T)
    {
        TempDir Dir;
        ConfigParser Parser;
        Parser.Reset();
        T.Check(!Parser.Parse(Dir.File("absent.conf")), "missing file should fail");
        T.Check(Parser.GetErrors().size() == 1, "missing file should report one error");
        if (!Parser.GetErrors().empty())
        {
            T.CheckContains(Parser.GetErrors()[0], "Config file does not exist", "missing file message");
        }

        Parser.Reset();
        T.Check(Parser.GetErrors().empty() && Parser.GetInfos().empty(), "Reset should clear messages");
    }
}

int main()
{
    TestContext T;
    TestValidConfig(T);
    TestInvalidValues(T);
    TestMissingFile(T);
    return T.Finish("config_parser_tests");
}
