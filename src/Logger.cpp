#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include "TimeUtils.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

void Logger::Init(const std::string& logDir)
{
    std::error_code Ec;
    if (!FS::exists(logDir, Ec))
    {
        FS::create_directories(logDir, Ec);
        if (Ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << logDir << " - " << Ec.message() << "\n";
            return;
        }
    }

    LogDirectory = logDir;
    CurrentLogFilePath = (FS::path(logDir) / ("FileOps_Log" + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);

    Info("Session Started at " + GetTimestamp());
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        Info("Session Closed at " + GetTimestamp());
        LogFile.close();
    }
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

bool Logger::IsOpen()
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    return LogFile.is_open();
}

void Logger::CleanupOldLogs()
{
    if (LogDirectory.empty())
    {
        return;
    }

    std::vector<FS::directory_entry> Logs;
    std::error_code Ec;

    for (const auto& Entry : FS::directory_iterator(LogDirectory, Ec))
    {
        if (Entry.is_regular_file() && Entry.path().filename().string().find("FileOps_Log") == 0)
        {
            Logs.push_back(Entry);
        }
    }
    if (Ec)
    {
        Error("[Logger] Could not list log directory: " + Ec.message());
        return;
    }

    if ((int)Logs.size() <= ConfigGlobal::MaxLogFiles)
    {
        return;
    }

    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    while ((int)Logs.size() > ConfigGlobal::MaxLogFiles)
    {
        std::error_code RemoveEc;
        if (!FS::remove(Logs.front(), RemoveEc) && RemoveEc)
        {
            Error("[Logger] Could not remove old log " + Logs.front().path().string() + ": " + RemoveEc.message());
        }
        Logs.erase(Logs.begin());
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open())
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::tm Local = ToLocalTm(std::chrono::system_clock::to_time_t(Now));

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::tm Local = ToLocalTm(std::chrono::system_clock::to_time_t(Now));

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S"); // human-readable timestamp for logs
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
