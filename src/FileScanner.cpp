#include <algorithm>
#include <filesystem>
#include <stack>

#include "FileScanner.hpp"
#include "PathUtils.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

const std::vector<ScannedFileInfo>& FileScanner::GetFiles() const
{
    return Files;
}

const std::vector<std::string>& FileScanner::GetErrors() const
{
    return Errors;
}

void FileScanner::Clear()
{
    Root.clear();
    Files.clear();
    Directories.clear();
    Errors.clear();
}

uintmax_t FileScanner::GetTotalSize() const
{
    uintmax_t Total = 0;
    for (const auto& File : Files)
    {
        Total += File.Size;
    }
    return Total;
}

std::vector<FS::path> FileScanner::GetDirectoriesDeepestFirst() const
{
    std::vector<FS::path> Sorted = Directories;
    std::sort(Sorted.begin(), Sorted.end(), [](const FS::path& A, const FS::path& B)
    {
            return std::distance(A.begin(), A.end()) > std::distance(B.begin(), B.end());
    });
    return Sorted;
}

bool FileScanner::Scan(const FS::path& RootPath, bool Recursive)
{
    Clear();
    Root = PathUtils::NormalizeLongPath(RootPath);
    try
    {
        if (!FS::exists(Root))
        {
            Errors.push_back("Path does not exist: " + Root.string());
            Log.Error("[FileScanner] Path does not exist: " + Root.string());
            return false;
        }
        if (FS::is_regular_file(Root)) // Single file case
        {
            ScannedFileInfo Info;
            Info.AbsolutePath = Root;
            Info.RelativePath = Root.filename();
            Info.Size = FS::file_size(Root);
            Info.MTime = ToTimeT(FS::last_write_time(Root));
            Files.push_back(std::move(Info));
            return true;
        }
        if (!FS::is_directory(Root))
        {
            Errors.push_back("Path is neither a directory nor a file: " + Root.string());
            Log.Error("[FileScanner] Path is neither a directory nor a file: " + Root.string());
            return false;
        }
        // Directory case
        ScanDirectoryIterative(Root, Recursive);
    }
    catch (const FS::filesystem_error& e)
    {
        Errors.push_back(e.what());
        Log.Error(std::string("[FileScanner] Filesystem error during scan: ") + e.what() + std::string(" Path: ") + e.path1().string());
        return false;
    }
    return Errors.empty();
}

void FileScanner::ScanDirectoryIterative(const FS::path& ScanRoot, bool Recursive)
{
    std::stack<FS::path> DirStack;
    DirStack.push(ScanRoot);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        try
        {
            for (const auto& Entry : FS::directory_iterator(PathUtils::NormalizeLongPath(Current)))
            {
                try
                {
                    FS::path AbsPath = PathUtils::NormalizeLongPath(Entry.path());
                    // Skip symbolic links to avoid loops or unsupported files.
                    if (FS::is_symlink(Entry.symlink_status()))
                    {
                        Log.Info(std::string("[FileScanner] Skipping SymLink: ") + AbsPath.string());
                        continue;
                    }
                    if (Entry.is_directory())
                    {
                        Directories.push_back(AbsPath);
                        if (Recursive)
                        {
                            DirStack.push(AbsPath);
                        }
                    }
                    else if (Entry.is_regular_file())
                    {
                        ScannedFileInfo Info;
                        Info.AbsolutePath = AbsPath;
                        Info.RelativePath = AbsPath.lexically_relative(ScanRoot);
                        Info.Size = Entry.file_size();
                        Info.MTime = ToTimeT(Entry.last_write_time());
                        Files.push_back(std::move(Info));
                    }
                }
                catch (const FS::filesystem_error& e)
                {
                    Errors.push_back(e.what());
                    Log.Error(std::string("[FileScanner] Filesystem error accessing entry: ") + e.what() + std::string(" Path: ") + Entry.path().string());
                }
            }
        }
        catch (const FS::filesystem_error& e)
        {
            Errors.push_back(e.what());
            Log.Error(std::string("[FileScanner] Filesystem error iterating directory: ") + e.what() + std::string(" Path: ") + Current.string());
        }
    }
}
