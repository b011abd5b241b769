#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

struct ScannedFileInfo
{
    std::filesystem::path AbsolutePath;
    std::filesystem::path RelativePath;
    uintmax_t Size = 0;
    int64_t MTime = 0;
};

class FileScanner
{
public:
    FileScanner() = default;

    void Clear();

    // Recursive unless told otherwise. Symlinks are skipped.
    bool Scan(const std::filesystem::path& RootPath, bool Recursive = true);

    const std::vector<ScannedFileInfo>& GetFiles() const;
    // Every directory below the root, deepest first
    std::vector<std::filesystem::path> GetDirectoriesDeepestFirst() const;
    uintmax_t GetTotalSize() const;
    const std::vector<std::string>& GetErrors() const;

private:
    std::filesystem::path Root;
    std::vector<ScannedFileInfo> Files;
    std::vector<std::filesystem::path> Directories;
    std::vector<std::string> Errors;

    void ScanDirectoryIterative(const std::filesystem::path& ScanRoot, bool Recursive);
};
