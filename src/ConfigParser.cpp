#include <fstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "ConflictResolver.hpp"
#include "FileHasher.hpp"

namespace FS = std::filesystem;

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Errors.clear();
    Infos.clear();

    ConfigGlobal::InitializeDefaults();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned int MinValue, unsigned int MaxValue, unsigned int& Out)
{
    try
    {
        size_t Consumed = 0;
        long long ValueNum = std::stoll(Value, &Consumed);
        if (Consumed != Value.size())
        {
            AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
            return false;
        }
        if (ValueNum < static_cast<long long>(MinValue) || ValueNum > static_cast<long long>(MaxValue))
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must be between " + std::to_string(MinValue) + " and " + std::to_string(MaxValue) + ".");
            return false;
        }
        Out = static_cast<unsigned int>(ValueNum);
        AddInfo(Key + " set to " + std::to_string(Out));
        return true;
    }
    catch (const std::logic_error&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
        return false;
    }
}

bool ConfigParser::ParseYesNo(const std::string& Key, const std::string& Value, int LineNumber, bool& Out)
{
    if (Value == "YES")
    {
        Out = true;
        AddInfo(Key + " Enabled.");
        return true;
    }
    if (Value == "NO")
    {
        Out = false;
        AddInfo(Key + " Disabled.");
        return true;
    }
    AddError("Line " + std::to_string(LineNumber) + ": Invalid value for " + Key + ". Use 'YES' or 'NO'.");
    return false;
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    if (!std::filesystem::exists(FilePath))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;

        // Trim leading whitespace
        Line.erase(Line.begin(), std::find_if(Line.begin(), Line.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        // Trim trailing whitespace
        Line.erase(std::find_if(Line.rbegin(), Line.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Line.end());

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Line.substr(EqualPos + 1);

        Key.erase(std::remove_if(Key.begin(), Key.end(),[](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        Value.erase(Value.begin(), std::find_if(Value.begin(), Value.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Value.erase(std::find_if(Value.rbegin(), Value.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Value.end());

        unsigned int Number = 0;

        if (Key == "MaxConcurrentOperations")
        {
            if (ParseCount(Key, Value, LineNumber, 1, 64, Number))
            {
                ConfigGlobal::MaxConcurrentOperations = static_cast<unsigned short int>(Number);
            }
        }

        else if (Key == "RetryAttempts")
        {
            if (ParseCount(Key, Value, LineNumber, 1, 100, Number))
            {
                ConfigGlobal::RetryAttempts = static_cast<unsigned short int>(Number);
            }
        }

        else if (Key == "RetryDelayMs")
        {
            if (ParseCount(Key, Value, LineNumber, 0, 600000, Number))
            {
                ConfigGlobal::RetryDelayMs = Number;
            }
        }

        else if (Key == "VerifyChunkSizeMB")
        {
            if (ParseCount(Key, Value, LineNumber, 1, 1024, Number))
            {
                ConfigGlobal::VerifyChunkSizeMB = static_cast<unsigned short int>(Number);
            }
        }

        else if (Key == "CopyWorkers")
        {
            if (ParseCount(Key, Value, LineNumber, 0, 256, Number))
            {
                ConfigGlobal::CopyWorkers = static_cast<unsigned short int>(Number);
            }
        }

        else if (Key == "VerifyWorkers")
        {
            if (ParseCount(Key, Value, LineNumber, 0, 256, Number))
            {
                ConfigGlobal::VerifyWorkers = static_cast<unsigned short int>(Number);
            }
        }

        else if (Key == "MaxLogFiles")
        {
            if (ParseCount(Key, Value, LineNumber, 1, 1000, Number))
            {
                ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(Number);
            }
        }

        else if (Key == "AutoSaveHistory")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::AutoSaveHistory);
        }

        else if (Key == "VerifyAfterCopy")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::VerifyAfterCopy);
        }

        else if (Key == "HistoryFile")
        {
            ConfigGlobal::HistoryFile = Value;
            AddInfo(Value.empty() ? std::string("History persistence disabled.") : "HistoryFile set to " + Value);
        }

        else if (Key == "LogDir")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": LogDir cannot be empty.");
                continue;
            }
            std::error_code Ec;
            if (FS::exists(Value, Ec) && !FS::is_directory(Value, Ec))
            {
                AddError("Line " + std::to_string(LineNumber) + ": LogDir exists but is not a directory.");
                continue;
            }
            ConfigGlobal::LogDir = Value;
            AddInfo("LogDir set to " + Value);
        }

        else if (Key == "VerifyAlgorithm")
        {
            if (!ParseHashAlgorithm(Value))
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid VerifyAlgorithm. Use 'crc32', 'md5', 'sha256', 'sha512' or 'blake3'.");
                continue;
            }
            ConfigGlobal::VerifyAlgorithm = Value;
            AddInfo("VerifyAlgorithm set to " + Value);
        }

        else if (Key == "DefaultConflictAction")
        {
            if (!ParseConflictAction(Value))
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid DefaultConflictAction. Use 'skip', 'overwrite', 'overwrite_older', 'rename' or 'ask'.");
                continue;
            }
            ConfigGlobal::DefaultConflictAction = Value;
            AddInfo("DefaultConflictAction set to " + Value);
        }

        else if (Key == "RenamePattern")
        {
            if (Value.find("{counter}") == std::string::npos)
            {
                AddError("Line " + std::to_string(LineNumber) + ": RenamePattern must contain '{counter}'.");
                continue;
            }
            ConfigGlobal::RenamePattern = Value;
            AddInfo("RenamePattern set to " + Value);
        }

        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
        }
    }

    return Errors.empty();
}
