#include "FileMover.hpp"
#include "FileScanner.hpp"
#include "FileVerifier.hpp"
#include "Logger.hpp"
#include "PathUtils.hpp"

#include <filesystem>
#include <map>
#include <system_error>

namespace FS = std::filesystem;

namespace
{
    FileResult FromErrorCode(const std::error_code& Ec, const std::string& What)
    {
        return FileResult::Failure(ClassifyErrorCode(Ec), What + ": " + Ec.message());
    }

    bool CreateParent(const std::string& Dest, std::error_code& Ec)
    {
        FS::path Parent = FS::path(Dest).parent_path();
        if (Parent.empty())
        {
            return true;
        }
        FS::create_directories(PathUtils::NormalizeLongPath(Parent), Ec);
        return !Ec;
    }
}

const char* ToString(MoveStrategy Strategy)
{
    return Strategy == MoveStrategy::Rename ? "rename" : "copy_delete";
}

FileMover::FileMover(FileCopier& Copier, const FileVerifier* Verifier, bool VerifyAfterMove, bool PreserveMetadata)
    : Copier(Copier), Verifier(Verifier), VerifyAfterMove(VerifyAfterMove), PreserveMetadata(PreserveMetadata)
{
}

bool FileMover::IsSameVolume(const std::string& Source, const std::string& Dest) const
{
    return PathUtils::IsSameVolume(Source, Dest);
}

MoveStrategy FileMover::GetMoveStrategy(const std::string& Source, const std::string& Dest) const
{
    return IsSameVolume(Source, Dest) ? MoveStrategy::Rename : MoveStrategy::CopyDelete;
}

bool FileMover::ShouldVerify(const CopyOptions& Options) const
{
    return (VerifyAfterMove || Options.Verify) && Verifier != nullptr;
}

CopyOptions FileMover::Effective(const CopyOptions& Options)
{
    CopyOptions Result;
    Result.PreserveMetadata = PreserveMetadata && Options.PreserveMetadata;
    // Verification runs here after the copy, so a mismatch keeps the source
    Result.Verify = ShouldVerify(Options);
    Result.Control = Options.Control ? Options.Control : &Copier.GetControl();
    return Result;
}

FileResult FileMover::MoveFile(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options)
{
    CopyOptions Active = Effective(Options);
    if (Active.Control->IsCancelled() || !Active.Control->WaitIfPaused())
    {
        return FileResult::Cancelled();
    }

    std::error_code Ec;
    if (!FS::exists(Source, Ec))
    {
        return FileResult::Failure(FileErrorKind::SourceNotFound, "Source file not found: " + Source);
    }
    if (!CreateParent(Dest, Ec))
    {
        return FromErrorCode(Ec, "Cannot create destination directory for " + Dest);
    }

    if (IsSameVolume(Source, Dest))
    {
        return MoveSameVolume(Source, Dest, Progress, Active);
    }
    return MoveCrossVolume(Source, Dest, Progress, Active);
}

FileResult FileMover::MoveSameVolume(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options)
{
    std::error_code Ec;
    FS::rename(Source, Dest, Ec);
    if (!Ec)
    {
        Log.Info("[FileMover] Renamed: " + Source + " → " + Dest);
        return FileResult::Ok();
    }

    // Bind mounts share a device id yet refuse rename
    if (Ec == std::errc::cross_device_link)
    {
        Log.Info("[FileMover] Rename crossed devices, falling back to copy: " + Source);
        return MoveCrossVolume(Source, Dest, Progress, Options);
    }

    Log.Error("[FileMover] Rename failed: " + Source + " → " + Dest + ": " + Ec.message());
    return FromErrorCode(Ec, "Rename failed for " + Source);
}

// Options.Verify here means verify before deleting the source; the copy itself never verifies
FileResult FileMover::MoveCrossVolume(const std::string& Source, const std::string& Dest, const ProgressCallback& Progress, const CopyOptions& Options)
{
    CopyOptions ForCopy = Options;
    ForCopy.Verify = false;
    FileResult Copied = Copier.CopyFileWithRetry(Source, Dest, Progress, ForCopy);
    if (!Copied.Success)
    {
        // The copier already removed any partial destination; the source is untouched
        return Copied;
    }
    return FinishCrossVolume(Source, Dest, Options.Verify);
}

FileResult FileMover::FinishCrossVolume(const std::string& Source, const std::string& Dest, bool Verify)
{
    std::error_code Ec;
    if (Verify && Verifier)
    {
        FileResult Verified = Verifier->VerifyCopy(Source, Dest);
        if (!Verified.Success)
        {
            FS::remove(Dest, Ec);
            if (Ec)
            {
                Log.Error("[FileMover] Failed to remove unverified destination " + Dest + ": " + Ec.message());
            }
            Log.Error("[FileMover] Verification failed, source kept: " + Source + ": " + Verified.Error);
            FileErrorKind Kind = Verified.Kind == FileErrorKind::None ? FileErrorKind::HashMismatch : Verified.Kind;
            return FileResult::Failure(Kind, "Verification failed: " + Verified.Error);
        }
    }

    FS::remove(Source, Ec);
    if (Ec)
    {
        Log.Error("[FileMover] Copy succeeded but delete failed for " + Source + ": " + Ec.message());
        return FileResult::Failure(ClassifyErrorCode(Ec), "Copy succeeded but delete failed: " + Ec.message());
    }
    Log.Info("[FileMover] Moved: " + Source + " → " + Dest);
    return FileResult::Ok();
}

ResultMap FileMover::MoveFilesBatch(const std::vector<std::pair<std::string, std::string>>& FilePairs, const BatchProgressCallback& Progress, const CopyOptions& Options)
{
    CopyOptions Active = Effective(Options);
    TransferControl& Control = *Active.Control;
    ResultMap Results;

    std::vector<std::pair<std::string, std::string>> SameVolume;
    std::vector<std::pair<std::string, std::string>> CrossVolume;
    for (const auto& Pair : FilePairs)
    {
        std::error_code Ec;
        if (!CreateParent(Pair.second, Ec))
        {
            Results[Pair.second] = FromErrorCode(Ec, "Cannot create destination directory for " + Pair.second);
            continue;
        }
        if (IsSameVolume(Pair.first, Pair.second))
        {
            SameVolume.push_back(Pair);
        }
        else
        {
            CrossVolume.push_back(Pair);
        }
    }

    for (const auto& [Source, Dest] : SameVolume)
    {
        if (Control.IsCancelled() || !Control.WaitIfPaused())
        {
            Results[Dest] = FileResult::Cancelled();
            continue;
        }
        ProgressCallback FileProgress;
        if (Progress)
        {
            FileProgress = [&Progress, &Dest = Dest](uint64_t Copied, uint64_t Total) { Progress(Dest, Copied, Total); };
        }
        Results[Dest] = MoveSameVolume(Source, Dest, FileProgress, Active);
    }

    if (CrossVolume.empty())
    {
        return Results;
    }

    std::map<std::string, std::string> SourceOf;
    for (const auto& [Source, Dest] : CrossVolume)
    {
        SourceOf[Dest] = Source;
    }

    CopyOptions ForCopy = Active;
    ForCopy.Verify = false;
    ResultMap Copied = Copier.CopyFilesBatch(CrossVolume, Progress, ForCopy);
    for (auto& [Dest, Result] : Copied)
    {
        if (!Result.Success)
        {
            Results[Dest] = std::move(Result);
            continue;
        }
        Results[Dest] = FinishCrossVolume(SourceOf[Dest], Dest, Active.Verify);
    }
    return Results;
}

ResultMap FileMover::MoveDirectory(const std::string& SourceDir, const std::string& DestDir, const BatchProgressCallback& Progress, const CopyOptions& Options)
{
    std::error_code Ec;
    if (!FS::is_directory(SourceDir, Ec))
    {
        throw FileOperationError(FileErrorKind::SourceNotFound, "Source directory not found: " + SourceDir);
    }

    FileScanner Scanner;
    if (!Scanner.Scan(SourceDir, true))
    {
        Log.Error("[FileMover] " + std::to_string(Scanner.GetErrors().size()) + " entries could not be read under " + SourceDir);
    }

    FS::path SourceRoot(SourceDir);
    FS::path DestRoot(DestDir);

    if (IsSameVolume(SourceDir, DestDir) && !FS::exists(DestRoot, Ec))
    {
        if (CreateParent(DestDir, Ec))
        {
            FS::rename(SourceRoot, DestRoot, Ec);
        }
        if (!Ec)
        {
            Log.Info("[FileMover] Renamed directory: " + SourceDir + " → " + DestDir);
            ResultMap Results;
            for (const auto& File : Scanner.GetFiles())
            {
                Results[(DestRoot / File.RelativePath).string()] = FileResult::Ok();
            }
            return Results;
        }
        Log.Info("[FileMover] Directory rename failed, moving file by file: " + Ec.message());
        Ec.clear();
    }

    FS::create_directories(DestRoot, Ec);
    if (Ec)
    {
        throw FileOperationError(ClassifyErrorCode(Ec), "Cannot create destination directory " + DestDir + ": " + Ec.message());
    }
    std::vector<FS::path> Directories = Scanner.GetDirectoriesDeepestFirst();
    for (const auto& Dir : Directories)
    {
        FS::create_directories(DestRoot / Dir.lexically_relative(SourceRoot), Ec);
    }

    std::vector<std::pair<std::string, std::string>> FilePairs;
    for (const auto& File : Scanner.GetFiles())
    {
        FilePairs.emplace_back(File.AbsolutePath.string(), (DestRoot / File.RelativePath).string());
    }

    ResultMap Results = MoveFilesBatch(FilePairs, Progress, Options);

    // Prune what is now empty, deepest first, the root last
    Directories.push_back(SourceRoot);
    for (const auto& Dir : Directories)
    {
        if (FS::is_directory(Dir, Ec) && FS::is_empty(Dir, Ec))
        {
            FS::remove(Dir, Ec);
            if (Ec)
            {
                Log.Error("[FileMover] Could not remove empty directory " + Dir.string() + ": " + Ec.message());
            }
        }
    }
    return Results;
}

uintmax_t FileMover::CalculateTotalSize(const std::vector<std::string>& Paths)
{
    uintmax_t Total = 0;
    for (const auto& Path : Paths)
    {
        std::error_code Ec;
        if (FS::is_regular_file(Path, Ec))
        {
            uintmax_t Size = FS::file_size(Path, Ec);
            if (!Ec)
            {
                Total += Size;
            }
        }
        else if (FS::is_directory(Path, Ec))
        {
            FileScanner Scanner;
            if (!Scanner.Scan(Path, true))
            {
                Log.Error("[FileMover] Size of " + Path + " is incomplete, some entries could not be read");
            }
            Total += Scanner.GetTotalSize();
        }
    }
    return Total;
}

std::optional<double> FileMover::EstimateMoveTime(const std::string& Source, const std::string& Dest, double AverageSpeed) const
{
    if (IsSameVolume(Source, Dest) || AverageSpeed <= 0.0)
    {
        return std::nullopt;
    }
    std::error_code Ec;
    uintmax_t Size = FS::file_size(Source, Ec);
    if (Ec)
    {
        return std::nullopt;
    }
    return static_cast<double>(Size) / AverageSpeed;
}

void FileMover::Pause()
{
    Copier.Pause();
}

void FileMover::Resume()
{
    Copier.Resume();
}

void FileMover::Cancel()
{
    Copier.Cancel();
}

void FileMover::ResetCancel()
{
    Copier.ResetCancel();
}
