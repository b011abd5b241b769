#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

enum class ConflictAction
{
    Skip,
    Overwrite,
    OverwriteIfNewer,   // Overwrite only when the source mtime is newer
    Rename,
    Ask
};

// History and config spelling: skip, overwrite, overwrite_older, rename, ask
const char* ToString(ConflictAction Action);
std::optional<ConflictAction> ParseConflictAction(const std::string& Name);

struct ConflictResolution
{
    ConflictAction Action = ConflictAction::Skip;
    std::string NewPath;        // Set for Rename
    bool ApplyToAll = false;    // Sticky for every later conflict of the same resolver
};

struct ConflictInfo
{
    std::string SourcePath;
    std::string DestPath;
    bool SourceExists = false;
    bool DestExists = false;
    uintmax_t SourceSize = 0;
    uintmax_t DestSize = 0;
    int64_t SourceMTime = 0;
    int64_t DestMTime = 0;
    bool SourceNewer = false;
    bool SourceLarger = false;
    bool SameSize = false;
    std::string Error;
};

// One resolver per batch: the apply-to-all override lives as long as the batch does.
// Not thread safe.
class ConflictResolver
{
public:
    using AskCallback = std::function<ConflictResolution(const std::string& SourcePath, const std::string& DestPath)>;

    static constexpr const char* DefaultRenamePattern = "{stem} ({counter}){suffix}";
    static constexpr int MaxRenameAttempts = 9999;

    explicit ConflictResolver(ConflictAction DefaultAction = ConflictAction::Ask, std::string RenamePattern = DefaultRenamePattern);

    void SetCallback(AskCallback Callback);

    // Throws FileOperationError(ConflictUnresolved) when no unique name can be produced
    ConflictResolution Resolve(const std::string& SourcePath, const std::string& DestPath);

    void SetApplyToAll(std::optional<ConflictAction> Action);
    void ResetApplyToAll();
    std::optional<ConflictAction> GetApplyToAll() const { return ApplyToAll; }

    // Paths claimed by earlier entries of the batch; generated names never land on them
    void Reserve(const std::string& Path);
    bool IsReserved(const std::string& Path) const;

    ConflictAction GetDefaultAction() const { return DefaultAction; }
    const std::string& GetRenamePattern() const { return RenamePattern; }

    std::string GenerateUniqueName(const std::string& DestPath) const;
    std::vector<std::string> GetRenamePreview(const std::string& DestPath, size_t MaxSuggestions = 5) const;

    static std::string CustomRename(const std::string& DestPath, const std::string& NewName);
    // {stem} {suffix} {counter} {index}; no two entries map to the same target
    static std::map<std::string, std::string> BatchRenameWithPattern(const std::vector<std::string>& Paths, const std::string& Pattern);

    // Ok only when DestPath is free and its parent exists and is writable
    static std::pair<bool, std::string> ValidateDestination(const std::string& DestPath);
    static ConflictInfo GetConflictInfo(const std::string& SourcePath, const std::string& DestPath);

private:
    ConflictResolution ApplyAction(ConflictAction Action, const std::string& SourcePath, const std::string& DestPath) const;
    static bool SourceIsNewer(const std::string& SourcePath, const std::string& DestPath);
    bool IsTaken(const std::string& Path) const;

    ConflictAction DefaultAction;
    std::string RenamePattern;
    std::optional<ConflictAction> ApplyToAll;
    AskCallback Callback;
    std::set<std::string> Reserved;
};
