#include "PathUtils.hpp"

#include <algorithm>
#include <cwctype>
#include <functional>
#include <system_error>

#ifdef _WIN32
#include <Windows.h>
#else
#include <sys/stat.h>
#endif

namespace FS = std::filesystem;

namespace PathUtils
{
#ifdef _WIN32

    FS::path NormalizeLongPath(const FS::path& Path)
    {
        std::wstring WPath = Path.wstring();

        // Already normalized
        if (WPath.starts_with(L"\\\\?\\"))
            return Path;

        constexpr size_t MAX_PATH_LIMIT = 260;

        if (WPath.size() >= MAX_PATH_LIMIT)
        {
            if (WPath.starts_with(L"\\\\"))
            {
                // UNC path: \\server\share → \\?\UNC\server\share
                return FS::path(L"\\\\?\\UNC\\" + WPath.substr(2));
            }
            // Local drive path: C:\folder\file → \\?\C:\folder\file
            return FS::path(L"\\\\?\\" + WPath);
        }
        return Path;
    }

    FS::path RemoveLongPathPrefix(const FS::path& Path)
    {
        std::wstring WPath = Path.wstring();

        constexpr wchar_t LongPrefix[] = L"\\\\?\\";
        constexpr size_t LongPrefixLen = 4;

        if (!WPath.starts_with(LongPrefix))
        {
            return Path;
        }
        if (WPath.size() > LongPrefixLen + 3 && WPath.compare(LongPrefixLen, 4, L"UNC\\") == 0)
        {
            return FS::path(L"\\\\" + WPath.substr(LongPrefixLen + 4));
        }
        return FS::path(WPath.substr(LongPrefixLen));
    }

#else

    FS::path NormalizeLongPath(const FS::path& Path)
    {
        return Path;
    }

    FS::path RemoveLongPathPrefix(const FS::path& Path)
    {
        return Path;
    }

#endif

    FS::path NearestExistingPath(const FS::path& Path)
    {
        std::error_code Ec;
        FS::path Current = FS::absolute(Path, Ec);
        if (Ec)
        {
            Current = Path;
        }
        while (!Current.empty())
        {
            if (FS::exists(Current, Ec))
            {
                return Current;
            }
            FS::path Parent = Current.parent_path();
            if (Parent == Current)
            {
                break;
            }
            Current = Parent;
        }
        return {};
    }

    std::optional<uint64_t> GetDeviceId(const FS::path& Path)
    {
#ifdef _WIN32
        std::error_code Ec;
        FS::path Absolute = FS::absolute(RemoveLongPathPrefix(Path), Ec);
        if (Ec)
        {
            return std::nullopt;
        }
        std::wstring Root = Absolute.root_name().wstring();
        if (Root.empty())
        {
            return std::nullopt;
        }
        std::transform(Root.begin(), Root.end(), Root.begin(), [](wchar_t Ch) { return static_cast<wchar_t>(std::towupper(Ch)); });
        return static_cast<uint64_t>(std::hash<std::wstring>{}(Root));
#else
        struct stat StatBuf;
        if (stat(Path.c_str(), &StatBuf) == 0)
        {
            return static_cast<uint64_t>(StatBuf.st_dev);
        }
        FS::path Parent = Path.parent_path();
        if (Parent.empty())
        {
            Parent = ".";
        }
        if (stat(Parent.c_str(), &StatBuf) == 0)
        {
            return static_cast<uint64_t>(StatBuf.st_dev);
        }
        return std::nullopt;
#endif
    }

    bool IsSameVolume(const FS::path& First, const FS::path& Second)
    {
        std::optional<uint64_t> FirstDevice = GetDeviceId(First);
        std::optional<uint64_t> SecondDevice = GetDeviceId(Second);
        return FirstDevice && SecondDevice && *FirstDevice == *SecondDevice;
    }

    std::string RelativeKey(const FS::path& Path, const FS::path& Base)
    {
        return Path.lexically_relative(Base).generic_string();
    }
}
