#include "FileVerifier.hpp"
#include "FileScanner.hpp"
#include "Logger.hpp"
#include "PathUtils.hpp"
#include "ThreadPool.hpp"
#include "TimeUtils.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>

namespace FS = std::filesystem;

namespace
{
    std::string Trim(const std::string& Text)
    {
        const char* Whitespace = " \t\r\n";
        size_t Start = Text.find_first_not_of(Whitespace);
        if (Start == std::string::npos)
        {
            return {};
        }
        size_t End = Text.find_last_not_of(Whitespace);
        return Text.substr(Start, End - Start + 1);
    }

    std::string Lowercase(std::string Text)
    {
        std::transform(Text.begin(), Text.end(), Text.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Text;
    }
}

FileVerifier::FileVerifier(HashAlgorithm Algorithm, size_t ChunkSize) : Algorithm(Algorithm), ChunkSize(ChunkSize == 0 ? DefaultChunkSize : ChunkSize)
{
}

std::string FileVerifier::CalculateHash(const std::string& Path) const
{
    return FileHasher::HashFile(Path, Algorithm, ChunkSize);
}

std::string FileVerifier::CalculateHash(const std::string& Path, HashAlgorithm WithAlgorithm) const
{
    return FileHasher::HashFile(Path, WithAlgorithm, ChunkSize);
}

FileResult FileVerifier::VerifyCopy(const std::string& SourcePath, const std::string& DestPath) const
{
    try
    {
        std::error_code Ec;
        uintmax_t SourceSize = FS::file_size(SourcePath, Ec);
        if (Ec)
        {
            return FileResult::Failure(ClassifyErrorCode(Ec), "Verification error: " + SourcePath + ": " + Ec.message());
        }
        uintmax_t DestSize = FS::file_size(DestPath, Ec);
        if (Ec)
        {
            return FileResult::Failure(ClassifyErrorCode(Ec), "Verification error: " + DestPath + ": " + Ec.message());
        }

        if (SourceSize != DestSize)
        {
            return FileResult::Failure(FileErrorKind::SizeMismatch, "Size mismatch: " + std::to_string(SourceSize) + " vs " + std::to_string(DestSize));
        }

        std::string SourceHash = CalculateHash(SourcePath);
        std::string DestHash = CalculateHash(DestPath);

        if (SourceHash != DestHash)
        {
            return FileResult::Failure(FileErrorKind::HashMismatch, "Hash mismatch: " + SourceHash + " vs " + DestHash);
        }
        return FileResult::Ok();
    }
    catch (const FileOperationError& e)
    {
        return FileResult::Failure(e.GetKind(), std::string("Verification error: ") + e.what());
    }
    catch (const std::exception& e)
    {
        return FileResult::Failure(FileErrorKind::IOError, std::string("Verification error: ") + e.what());
    }
}

ResultMap FileVerifier::VerifyBatch(const std::vector<std::pair<std::string, std::string>>& FilePairs, size_t MaxWorkers) const
{
    ResultMap Results;
    if (FilePairs.empty())
    {
        return Results;
    }

    size_t Workers = MaxWorkers > 0 ? MaxWorkers : ThreadPool::OptimalCPUWorkers();
    Workers = std::min(Workers, FilePairs.size());
    Log.Info("[FileVerifier] Verifying " + std::to_string(FilePairs.size()) + " files with " + std::to_string(Workers) + " workers using " + ToString(Algorithm));

    ThreadPool Pool(Workers);
    std::vector<std::pair<std::string, std::future<FileResult>>> Pending;
    Pending.reserve(FilePairs.size());

    for (const auto& [Source, Dest] : FilePairs)
    {
        Pending.emplace_back(Dest, Pool.SubmitTask([this, Source = Source, Dest = Dest]() { return VerifyCopy(Source, Dest); }));
    }

    for (auto& [Dest, Future] : Pending)
    {
        try
        {
            Results[Dest] = Future.get();
        }
        catch (const std::exception& e)
        {
            Results[Dest] = FileResult::Failure(FileErrorKind::IOError, std::string("Verification exception: ") + e.what());
        }
        if (!Results[Dest].Success)
        {
            Log.Error("[FileVerifier] " + Dest + ": " + Results[Dest].Error);
        }
    }
    return Results;
}

void FileVerifier::GenerateChecksumFile(const std::vector<std::string>& FilePaths, const std::string& OutputPath, ChecksumFormat Format) const
{
    std::ofstream Output(OutputPath, std::ios::out | std::ios::trunc);
    if (!Output.is_open())
    {
        throw FileOperationError(FileErrorKind::PermissionDenied, "Cannot write checksum file: " + OutputPath);
    }

    for (const auto& FilePath : FilePaths)
    {
        try
        {
            std::string HashValue = CalculateHash(FilePath);
            std::string FileName = FS::path(FilePath).filename().string();

            if (Format == ChecksumFormat::Sum)
            {
                Output << HashValue << " *" << FileName << "\n";
            }
            else
            {
                Output << FileName << ": " << HashValue << "\n";
            }
        }
        catch (const std::exception& e)
        {
            Output << "# Error processing " << FilePath << ": " << e.what() << "\n";
            Log.Error("[FileVerifier] Checksum skipped for " + FilePath + ": " + e.what());
        }
    }

    Output.flush();
    if (!Output)
    {
        throw FileOperationError(FileErrorKind::IOError, "Failed writing checksum file: " + OutputPath);
    }
}

ResultMap FileVerifier::VerifyChecksumFile(const std::string& ChecksumFile, const std::string& BaseDir) const
{
    FS::path Base = BaseDir.empty() ? FS::path(ChecksumFile).parent_path() : FS::path(BaseDir);
    ResultMap Results;

    std::ifstream Input(ChecksumFile);
    if (!Input.is_open())
    {
        throw FileOperationError(FileErrorKind::SourceNotFound, "Error reading checksum file: " + ChecksumFile);
    }

    std::string Line;
    while (std::getline(Input, Line))
    {
        Line = Trim(Line);

        // Skip comments and empty lines
        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        std::string ExpectedHash;
        std::string FileName;
        size_t Separator = Line.find(" *");
        if (Separator != std::string::npos)
        {
            ExpectedHash = Line.substr(0, Separator);
            FileName = Line.substr(Separator + 2);
        }
        else if ((Separator = Line.find(": ")) != std::string::npos)
        {
            FileName = Line.substr(0, Separator);
            ExpectedHash = Line.substr(Separator + 2);
        }
        else
        {
            continue;
        }
        ExpectedHash = Lowercase(Trim(ExpectedHash));

        FS::path FilePath = Base / FileName;
        std::error_code Ec;
        if (!FS::exists(FilePath, Ec))
        {
            Results[FileName] = FileResult::Failure(FileErrorKind::SourceNotFound, "File not found");
            continue;
        }

        try
        {
            std::string ActualHash = CalculateHash(FilePath.string());
            if (ActualHash == ExpectedHash)
            {
                Results[FileName] = FileResult::Ok();
            }
            else
            {
                Results[FileName] = FileResult::Failure(FileErrorKind::HashMismatch, "Hash mismatch: expected " + ExpectedHash + ", got " + ActualHash);
            }
        }
        catch (const FileOperationError& e)
        {
            Results[FileName] = FileResult::Failure(e.GetKind(), std::string("Error: ") + e.what());
        }
    }
    return Results;
}

ResultMap FileVerifier::CompareDirectories(const std::string& SourceDir, const std::string& DestDir, bool Recursive, size_t MaxWorkers) const
{
    FileScanner Scanner;
    if (!Scanner.Scan(SourceDir, Recursive) && Scanner.GetFiles().empty())
    {
        throw FileOperationError(FileErrorKind::SourceNotFound, "Cannot scan source directory: " + SourceDir);
    }

    FS::path DestRoot(DestDir);
    std::vector<std::pair<std::string, std::string>> FilePairs;
    for (const auto& File : Scanner.GetFiles())
    {
        FS::path DestFile = DestRoot / File.RelativePath;
        std::error_code Ec;
        if (FS::exists(DestFile, Ec))
        {
            FilePairs.emplace_back(File.AbsolutePath.string(), DestFile.string());
        }
    }

    ResultMap Results = VerifyBatch(FilePairs, MaxWorkers);

    ResultMap RelativeResults;
    for (auto& [DestFullPath, Result] : Results)
    {
        RelativeResults[PathUtils::RelativeKey(DestFullPath, DestRoot)] = std::move(Result);
    }
    return RelativeResults;
}

FileDigestInfo FileVerifier::GetFileInfo(const std::string& Path) const
{
    FileDigestInfo Info;
    Info.Path = Path;

    std::error_code Ec;
    Info.Exists = FS::exists(Path, Ec);
    if (!Info.Exists)
    {
        return Info;
    }

    try
    {
        Info.Size = FS::file_size(Path);
        Info.MTime = ToTimeT(FS::last_write_time(Path));
        Info.Hash = CalculateHash(Path);
        Info.Algorithm = ToString(Algorithm);
    }
    catch (const std::exception& e)
    {
        Info.Error = e.what();
    }
    return Info;
}
