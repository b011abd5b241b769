#pragma once

#include <filesystem>
#include <chrono>
#include <cctype>
#include <ctime>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

//UNIX Time since Epoch
inline int64_t ToTimeT(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    return duration_cast<seconds>(file_clock::to_sys(FTime).time_since_epoch()).count();
}

// Fractional seconds since epoch, the resolution mtime comparisons need
inline double ToEpochSeconds(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    return duration_cast<duration<double>>(file_clock::to_sys(FTime).time_since_epoch()).count();
}

inline std::tm ToLocalTm(std::time_t Time)
{
    std::tm Local{};
#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif
    return Local;
}

// Local time as YYYY-MM-DDTHH:MM:SS.ffffff
inline std::string FormatIso8601(std::chrono::system_clock::time_point Point)
{
    using namespace std::chrono;
    const auto Seconds = time_point_cast<std::chrono::seconds>(Point);
    auto Micros = duration_cast<microseconds>(Point - Seconds).count();
    if (Micros < 0)
    {
        Micros = 0;
    }
    std::tm Local = ToLocalTm(system_clock::to_time_t(Seconds));

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(6) << std::setfill('0') << Micros;
    return Stream.str();
}

inline std::optional<std::chrono::system_clock::time_point> ParseIso8601(const std::string& Text)
{
    using namespace std::chrono;
    std::tm Local{};
    std::istringstream Stream(Text);
    Stream >> std::get_time(&Local, "%Y-%m-%dT%H:%M:%S");
    if (Stream.fail())
    {
        return std::nullopt;
    }
    Local.tm_isdst = -1;
    std::time_t Time = std::mktime(&Local);
    if (Time == static_cast<std::time_t>(-1))
    {
        return std::nullopt;
    }

    auto Point = system_clock::from_time_t(Time);
    if (Stream.peek() == '.')
    {
        Stream.get();
        std::string Digits;
        while (std::isdigit(Stream.peek()))
        {
            Digits.push_back(static_cast<char>(Stream.get()));
        }
        Digits = Digits.substr(0, 6);
        while (Digits.size() < 6)
        {
            Digits.push_back('0');
        }
        Point += microseconds(std::stoll(Digits));
    }
    return Point;
}
