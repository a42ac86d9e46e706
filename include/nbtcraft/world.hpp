#ifndef NBTCRAFT_WORLD_HPP
#define NBTCRAFT_WORLD_HPP

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <type_traits>
#include <vector>

#include "error.hpp"
#include "log.hpp"
#include "region.hpp"

namespace nbtcraft {

struct RegionFileInfo {
    std::string path;
    int x;
    int z;
    RegionFormat format;
};

/// @brief Lists the `.mca` and `.mcr` files directly inside `dir`, sorted by (x, z).
/// Files whose names do not follow `r.<x>.<z>.<ext>` are skipped.
/// @exception Throws `io_error` if `dir` cannot be listed.
inline std::vector<RegionFileInfo> enumerate_region_files(const std::string& dir) {
    std::vector<RegionFileInfo> files;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
        throw nbt_error(errc::io_error, "Cannot list " + dir + ": " + ec.message());
    for (const std::filesystem::directory_entry& entry : it) {
        if (!entry.is_regular_file())
            continue;
        std::optional<RegionPos> pos = parse_region_filename(entry.path().filename().string());
        if (!pos)
            continue;
        files.push_back(RegionFileInfo{entry.path().string(), pos->x, pos->z, pos->format});
    }
    std::sort(files.begin(), files.end(), [](const RegionFileInfo& a, const RegionFileInfo& b) {
        return a.x != b.x ? a.x < b.x : a.z < b.z;
    });
    NBTCRAFT_LOG_DEBUG("Found {} region files in {}", files.size(), dir);
    return files;
}

/// @brief Lists region files per dimension of a world directory.
/// `region/` is dimension 0 and `DIM<n>/region/` is dimension n.
inline std::map<int, std::vector<RegionFileInfo>> enumerate_world(const std::string& dir) {
    static const std::regex dimension_pattern(R"(DIM(-?\d+))");
    std::map<int, std::vector<RegionFileInfo>> dims;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
        throw nbt_error(errc::io_error, "Cannot list " + dir + ": " + ec.message());
    for (const std::filesystem::directory_entry& entry : it) {
        if (!entry.is_directory())
            continue;
        std::string name = entry.path().filename().string();
        if (name == "region") {
            dims[0] = enumerate_region_files(entry.path().string());
            continue;
        }
        std::smatch m;
        if (!std::regex_match(name, m, dimension_pattern))
            continue;
        std::string digits = m[1].str();
        int dimension;
        auto [ptr, parse_ec] = std::from_chars(digits.data(), digits.data() + digits.size(), dimension);
        if (parse_ec != std::errc() || ptr != digits.data() + digits.size())
            continue;
        std::filesystem::path region_dir = entry.path() / "region";
        if (std::filesystem::is_directory(region_dir))
            dims[dimension] = enumerate_region_files(region_dir.string());
    }
    return dims;
}

/// @brief Groups region files by a caller-chosen key, for example `[](const RegionFileInfo& f) { return f.x; }`.
template <typename KeyFn>
auto group_region_files(const std::vector<RegionFileInfo>& files, KeyFn key) {
    std::map<std::decay_t<decltype(key(files.front()))>, std::vector<RegionFileInfo>> groups;
    for (const RegionFileInfo& file : files)
        groups[key(file)].push_back(file);
    return groups;
}

}

#endif
