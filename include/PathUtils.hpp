#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <cstdint>

namespace PathUtils
{
    // Adds the \\?\ prefix to Windows paths at or beyond MAX_PATH, no-op elsewhere
    std::filesystem::path NormalizeLongPath(const std::filesystem::path& Path);
    std::filesystem::path RemoveLongPathPrefix(const std::filesystem::path& Path);

    // Walks up from Path until an existing entry is found (empty when none)
    std::filesystem::path NearestExistingPath(const std::filesystem::path& Path);

    // Device identity of the volume holding Path, or of its parent when Path does not exist yet
    std::optional<uint64_t> GetDeviceId(const std::filesystem::path& Path);

    // Best effort: bind mounts can share a device id while rename still fails with EXDEV
    bool IsSameVolume(const std::filesystem::path& First, const std::filesystem::path& Second);

    std::string RelativeKey(const std::filesystem::path& Path, const std::filesystem::path& Base);
}
