#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "FileCopier.hpp"
#include "FileOpsError.hpp"

class FileVerifier;

enum class MoveStrategy
{
    Rename,     // Same volume: one atomic rename
    CopyDelete  // Cross volume: copy, optionally verify, then delete the source
};

const char* ToString(MoveStrategy Strategy);

class FileMover
{
public:
    static constexpr double DefaultAverageSpeed = 100.0 * 1024 * 1024;

    FileMover(FileCopier& Copier, const FileVerifier* Verifier = nullptr, bool VerifyAfterMove = false, bool PreserveMetadata = true);
    virtual ~FileMover() = default;

    FileMover(const FileMover&) = delete;
    FileMover& operator=(const FileMover&) = delete;

    MoveStrategy GetMoveStrategy(const std::string& Source, const std::string& Dest) const;
    // Device id comparison, falling back to the parent for paths that do not exist yet
    virtual bool IsSameVolume(const std::string& Source, const std::string& Dest) const;

    // Options.Verify and Options.PreserveMetadata combine with the mover's own settings.
    // The source is only removed once the destination is complete (and verified, when enabled).
    FileResult MoveFile(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress = nullptr, const CopyOptions& Options = CopyOptions());
    // Keyed by destination
    ResultMap MoveFilesBatch(const std::vector<std::pair<std::string, std::string>>& FilePairs, const BatchProgressCallback& Progress = nullptr, const CopyOptions& Options = CopyOptions());
    // Keyed by destination file; empty source directories are pruned afterwards
    ResultMap MoveDirectory(const std::string& SourceDir, const std::string& DestDir, const BatchProgressCallback& Progress = nullptr, const CopyOptions& Options = CopyOptions());

    static uintmax_t CalculateTotalSize(const std::vector<std::string>& Paths);
    // No estimate for a same volume move: it is a rename
    std::optional<double> EstimateMoveTime(const std::string& Source, const std::string& Dest, double AverageSpeed = DefaultAverageSpeed) const;

    void SetVerifyAfterMove(bool Enabled) { VerifyAfterMove = Enabled; }
    void SetPreserveMetadata(bool Enabled) { PreserveMetadata = Enabled; }

    void Pause();
    void Resume();
    void Cancel();
    void ResetCancel();

private:
    FileResult MoveSameVolume(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options);
    FileResult MoveCrossVolume(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options);
    // Verifies (when enabled) and removes the source of a finished copy
    FileResult FinishCrossVolume(const std::string& Source, const std::string& Dest, bool Verify);
    // Resolves the control; Verify then means verify before the source is deleted
    CopyOptions Effective(const CopyOptions& Options);
    bool ShouldVerify(const CopyOptions& Options) const;

    FileCopier& Copier;
    const FileVerifier* Verifier;
    bool VerifyAfterMove;
    bool PreserveMetadata;
};
