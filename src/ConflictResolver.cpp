#include "ConflictResolver.hpp"
#include "FileOpsError.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace FS = std::filesystem;

namespace
{
    // Replaces every {Name} found in Values; unknown placeholders are left as they are
    std::string ExpandPattern(const std::string& Pattern, const std::map<std::string, std::string>& Values)
    {
        std::string Result;
        Result.reserve(Pattern.size() + 16);

        size_t Pos = 0;
        while (Pos < Pattern.size())
        {
            size_t Open = Pattern.find('{', Pos);
            if (Open == std::string::npos)
            {
                Result.append(Pattern, Pos, std::string::npos);
                break;
            }
            size_t Close = Pattern.find('}', Open);
            if (Close == std::string::npos)
            {
                Result.append(Pattern, Pos, std::string::npos);
                break;
            }

            Result.append(Pattern, Pos, Open - Pos);
            auto It = Values.find(Pattern.substr(Open + 1, Close - Open - 1));
            if (It != Values.end())
            {
                Result += It->second;
            }
            else
            {
                Result.append(Pattern, Open, Close - Open + 1);
            }
            Pos = Close + 1;
        }
        return Result;
    }

    std::string ReservationKey(const std::string& Path)
    {
        return FS::path(Path).lexically_normal().string();
    }

    bool IsWritableDirectory(const FS::path& Dir)
    {
#ifdef _WIN32
        return _waccess(Dir.wstring().c_str(), 2) == 0;
#else
        return access(Dir.c_str(), W_OK) == 0;
#endif
    }
}

const char* ToString(ConflictAction Action)
{
    switch (Action)
    {
    case ConflictAction::Skip:             return "skip";
    case ConflictAction::Overwrite:        return "overwrite";
    case ConflictAction::OverwriteIfNewer: return "overwrite_older";
    case ConflictAction::Rename:           return "rename";
    case ConflictAction::Ask:              return "ask";
    default:                               return "unknown";
    }
}

std::optional<ConflictAction> ParseConflictAction(const std::string& Name)
{
    std::string Lower = Name;
    std::transform(Lower.begin(), Lower.end(), Lower.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });

    if (Lower == "skip")            return ConflictAction::Skip;
    if (Lower == "overwrite")       return ConflictAction::Overwrite;
    if (Lower == "overwrite_older") return ConflictAction::OverwriteIfNewer;
    if (Lower == "rename")          return ConflictAction::Rename;
    if (Lower == "ask")             return ConflictAction::Ask;
    return std::nullopt;
}

ConflictResolver::ConflictResolver(ConflictAction DefaultAction, std::string RenamePattern)
    : DefaultAction(DefaultAction), RenamePattern(RenamePattern.empty() ? DefaultRenamePattern : std::move(RenamePattern))
{
}

void ConflictResolver::SetCallback(AskCallback NewCallback)
{
    Callback = std::move(NewCallback);
}

void ConflictResolver::SetApplyToAll(std::optional<ConflictAction> Action)
{
    ApplyToAll = Action;
}

void ConflictResolver::ResetApplyToAll()
{
    ApplyToAll.reset();
}

void ConflictResolver::Reserve(const std::string& Path)
{
    Reserved.insert(ReservationKey(Path));
}

bool ConflictResolver::IsReserved(const std::string& Path) const
{
    return Reserved.count(ReservationKey(Path)) != 0;
}

bool ConflictResolver::IsTaken(const std::string& Path) const
{
    std::error_code Ec;
    return FS::exists(Path, Ec) || Ec || IsReserved(Path);
}

ConflictResolution ConflictResolver::Resolve(const std::string& SourcePath, const std::string& DestPath)
{
    ConflictAction Action = ApplyToAll ? *ApplyToAll : DefaultAction;

    if (Action != ConflictAction::Ask)
    {
        return ApplyAction(Action, SourcePath, DestPath);
    }

    if (!Callback)
    {
        // Nobody to ask
        return ApplyAction(ConflictAction::Rename, SourcePath, DestPath);
    }

    ConflictResolution Answer = Callback(SourcePath, DestPath);
    if (Answer.ApplyToAll && Answer.Action != ConflictAction::Ask)
    {
        ApplyToAll = Answer.Action;
        Log.Info(std::string("[ConflictResolver] Applying '") + ToString(Answer.Action) + "' to all remaining conflicts");
    }

    if (Answer.Action == ConflictAction::Rename && !Answer.NewPath.empty())
    {
        if (!IsTaken(Answer.NewPath))
        {
            return Answer;
        }
        Log.Info("[ConflictResolver] Requested name is taken, generating one instead: " + Answer.NewPath);
    }

    // Ask again is not an answer
    ConflictAction Chosen = Answer.Action == ConflictAction::Ask ? ConflictAction::Rename : Answer.Action;
    ConflictResolution Resolved = ApplyAction(Chosen, SourcePath, DestPath);
    Resolved.ApplyToAll = Answer.ApplyToAll;
    return Resolved;
}

ConflictResolution ConflictResolver::ApplyAction(ConflictAction Action, const std::string& SourcePath, const std::string& DestPath) const
{
    ConflictResolution Resolution;
    switch (Action)
    {
    case ConflictAction::Overwrite:
        Resolution.Action = ConflictAction::Overwrite;
        break;
    case ConflictAction::OverwriteIfNewer:
        Resolution.Action = SourceIsNewer(SourcePath, DestPath) ? ConflictAction::Overwrite : ConflictAction::Skip;
        break;
    case ConflictAction::Rename:
    case ConflictAction::Ask:
        Resolution.Action = ConflictAction::Rename;
        Resolution.NewPath = GenerateUniqueName(DestPath);
        break;
    case ConflictAction::Skip:
    default:
        Resolution.Action = ConflictAction::Skip;
        break;
    }
    return Resolution;
}

bool ConflictResolver::SourceIsNewer(const std::string& SourcePath, const std::string& DestPath)
{
    std::error_code SourceEc;
    std::error_code DestEc;
    auto SourceTime = FS::last_write_time(SourcePath, SourceEc);
    auto DestTime = FS::last_write_time(DestPath, DestEc);
    if (SourceEc || DestEc)
    {
        return false;
    }
    return SourceTime > DestTime;
}

std::string ConflictResolver::GenerateUniqueName(const std::string& DestPath) const
{
    FS::path Path(DestPath);
    std::map<std::string, std::string> Values{
        { "stem", Path.stem().string() },
        { "suffix", Path.extension().string() },
        { "timestamp", Logger::GetTimestampForFilename() }
    };

    for (int Counter = 1; Counter <= MaxRenameAttempts; ++Counter)
    {
        Values["counter"] = std::to_string(Counter);
        FS::path Candidate = Path.parent_path() / ExpandPattern(RenamePattern, Values);
        if (!IsTaken(Candidate.string()))
        {
            return Candidate.string();
        }
    }

    Log.Error("[ConflictResolver] Could not generate unique name for " + DestPath);
    throw FileOperationError(FileErrorKind::ConflictUnresolved, "Could not generate unique name for " + DestPath);
}

std::vector<std::string> ConflictResolver::GetRenamePreview(const std::string& DestPath, size_t MaxSuggestions) const
{
    FS::path Path(DestPath);
    std::map<std::string, std::string> Values{
        { "stem", Path.stem().string() },
        { "suffix", Path.extension().string() },
        { "timestamp", Logger::GetTimestampForFilename() }
    };

    std::vector<std::string> Suggestions;
    std::set<std::string> Seen;
    for (int Counter = 1; Suggestions.size() < MaxSuggestions && Counter < 100; ++Counter)
    {
        Values["counter"] = std::to_string(Counter);
        FS::path Candidate = Path.parent_path() / ExpandPattern(RenamePattern, Values);

        if (!IsTaken(Candidate.string()) && Seen.insert(Candidate.string()).second)
        {
            Suggestions.push_back(Candidate.string());
        }
    }
    return Suggestions;
}

std::string ConflictResolver::CustomRename(const std::string& DestPath, const std::string& NewName)
{
    return (FS::path(DestPath).parent_path() / NewName).string();
}

std::map<std::string, std::string> ConflictResolver::BatchRenameWithPattern(const std::vector<std::string>& Paths, const std::string& Pattern)
{
    std::map<std::string, std::string> Renamed;
    std::set<std::string> Taken;

    size_t Index = 1;
    for (const auto& Original : Paths)
    {
        FS::path Path(Original);
        std::map<std::string, std::string> Values{
            { "stem", Path.stem().string() },
            { "suffix", Path.extension().string() },
            { "index", std::to_string(Index++) }
        };

        bool Found = false;
        for (int Counter = 1; Counter <= MaxRenameAttempts; ++Counter)
        {
            Values["counter"] = std::to_string(Counter);
            std::string Candidate = (Path.parent_path() / ExpandPattern(Pattern, Values)).string();

            std::error_code Ec;
            if (Taken.count(Candidate) == 0 && !FS::exists(Candidate, Ec))
            {
                Renamed[Original] = Candidate;
                Taken.insert(Candidate);
                Found = true;
                break;
            }
        }

        if (!Found)
        {
            throw FileOperationError(FileErrorKind::ConflictUnresolved, "Could not generate unique name for " + Original);
        }
    }
    return Renamed;
}

std::pair<bool, std::string> ConflictResolver::ValidateDestination(const std::string& DestPath)
{
    FS::path Path(DestPath);
    std::error_code Ec;

    if (FS::exists(Path, Ec))
    {
        return { false, "File already exists: " + DestPath };
    }

    FS::path Parent = Path.parent_path();
    if (Parent.empty())
    {
        Parent = FS::current_path(Ec);
    }
    if (!FS::exists(Parent, Ec))
    {
        return { false, "Parent directory does not exist: " + Parent.string() };
    }
    if (!IsWritableDirectory(Parent))
    {
        return { false, "Parent directory is not writable: " + Parent.string() };
    }
    return { true, "" };
}

ConflictInfo ConflictResolver::GetConflictInfo(const std::string& SourcePath, const std::string& DestPath)
{
    ConflictInfo Info;
    Info.SourcePath = SourcePath;
    Info.DestPath = DestPath;

    std::error_code Ec;
    Info.SourceExists = FS::exists(SourcePath, Ec);
    Info.DestExists = FS::exists(DestPath, Ec);

    try
    {
        if (Info.SourceExists)
        {
            Info.SourceSize = FS::is_regular_file(SourcePath) ? FS::file_size(SourcePath) : 0;
            Info.SourceMTime = ToTimeT(FS::last_write_time(SourcePath));
        }
        if (Info.DestExists)
        {
            Info.DestSize = FS::is_regular_file(DestPath) ? FS::file_size(DestPath) : 0;
            Info.DestMTime = ToTimeT(FS::last_write_time(DestPath));

            if (Info.SourceExists)
            {
                Info.SourceNewer = FS::last_write_time(SourcePath) > FS::last_write_time(DestPath);
                Info.SourceLarger = Info.SourceSize > Info.DestSize;
                Info.SameSize = Info.SourceSize == Info.DestSize;
            }
        }
    }
    catch (const FS::filesystem_error& e)
    {
        Info.Error = e.what();
    }
    return Info;
}
