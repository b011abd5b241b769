#pragma once

// Framework-less test helpers shared by every test executable (run via CTest)

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <thread>

struct TestContext
{
    int Failures = 0;

    void Check(bool Condition, const std::string& Message)
    {
        if (!Condition)
        {
            ++Failures;
            std::cerr << "[FAIL] " << Message << "\n";
        }
    }

    void CheckContains(const std::string& Haystack, const std::string& Needle, const std::string& Message)
    {
        Check(Haystack.find(Needle) != std::string::npos, Message + " (got: " + Haystack + ")");
    }

    int Finish(const std::string& Name) const
    {
        if (Failures != 0)
        {
            std::cerr << "[FAILURES] " << Failures << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "[OK] " << Name << "\n";
        return EXIT_SUCCESS;
    }
};

// Fresh directory under the system temp dir, removed with everything in it on destruction
class TempDir
{
public:
    TempDir()
    {
        static std::atomic<unsigned int> Counter{ 0 };
        std::random_device Device;
        std::ostringstream Name;
        Name << "fileops_test_" << std::hex << Device() << "_" << Counter++;
        Root = std::filesystem::temp_directory_path() / Name.str();
        std::filesystem::create_directories(Root);
    }

    ~TempDir()
    {
        std::error_code Ec;
        std::filesystem::remove_all(Root, Ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return Root; }
    std::string File(const std::string& RelativePath) const { return (Root / RelativePath).string(); }

private:
    std::filesystem::path Root;
};

inline void WriteFile(const std::string& Path, const std::string& Content)
{
    std::filesystem::path Parent = std::filesystem::path(Path).parent_path();
    if (!Parent.empty())
    {
        std::filesystem::create_directories(Parent);
    }
    std::ofstream Out(Path, std::ios::binary | std::ios::trunc);
    Out << Content;
}

inline std::string ReadFile(const std::string& Path)
{
    std::ifstream In(Path, std::ios::binary);
    std::ostringstream Content;
    Content << In.rdbuf();
    return Content.str();
}

inline std::string Pattern(size_t Size)
{
    std::string Content(Size, '\0');
    for (size_t i = 0; i < Size; ++i)
    {
        Content[i] = static_cast<char>('a' + (i * 7 + i / 13) % 26);
    }
    return Content;
}

inline void SetMTime(const std::string& Path, std::chrono::seconds Offset)
{
    std::filesystem::last_write_time(Path, std::filesystem::file_time_type::clock::now() + Offset);
}
