#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <cstdint>
#include <ctime>

#include <spdlog/fmt/fmt.h>

#include "../error.hpp"
#include "../timestamp.hpp"

/**
 * @file store_layout.hpp
 * @brief On-disk naming of a store
 *
 * @code
 * <base>/<name>.pcap                                   project index
 * <base>/<name>/data_<yyMMdd_HHmmss_fffffff>.pcap      segment files
 * @endcode
 *
 * The segment timestamp is the segment creation time in UTC with 100 ns resolution
 * (seven fractional digits). Sorting segments by that timestamp gives write order.
 */

namespace pcapstore::io {

inline constexpr std::string_view STORE_EXTENSION = ".pcap";
inline constexpr std::string_view SEGMENT_PREFIX = "data_";

/// Resolution of the fractional field in segment file names
inline constexpr uint32_t SEGMENT_NAME_TICK_NS = 100;

[[nodiscard]] inline std::filesystem::path index_path(const std::filesystem::path& base_dir,
                                                      std::string_view name) {
    return base_dir / (std::string(name) + std::string(STORE_EXTENSION));
}

[[nodiscard]] inline std::filesystem::path
segment_directory(const std::filesystem::path& base_dir, std::string_view name) {
    return base_dir / std::string(name);
}

/**
 * @brief Split "B/N.pcap" into {B, N}
 */
[[nodiscard]] inline std::pair<std::filesystem::path, std::string>
split_index_path(const std::filesystem::path& index_file) {
    auto base = index_file.parent_path();
    if (base.empty()) {
        base = ".";
    }
    return {base, index_file.stem().string()};
}

/**
 * @brief Round a timestamp down to the segment-name resolution
 */
[[nodiscard]] constexpr Timestamp truncate_to_segment_tick(Timestamp ts) noexcept {
    return Timestamp(ts.seconds(), ts.nanoseconds() - ts.nanoseconds() % SEGMENT_NAME_TICK_NS);
}

/**
 * @brief Format "data_yyMMdd_HHmmss_fffffff.pcap" for a UTC instant
 */
[[nodiscard]] inline std::string segment_file_name(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts.seconds());
    std::tm utc{};
    ::gmtime_r(&secs, &utc);

    return fmt::format("{}{:02}{:02}{:02}_{:02}{:02}{:02}_{:07}{}", SEGMENT_PREFIX,
                       utc.tm_year % 100, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                       utc.tm_sec, ts.nanoseconds() / SEGMENT_NAME_TICK_NS, STORE_EXTENSION);
}

/**
 * @brief Recover the creation timestamp from a segment file name
 * @return Timestamp, or nullopt if the name does not follow the segment pattern
 */
[[nodiscard]] inline std::optional<Timestamp> parse_segment_file_name(std::string_view name) {
    // data_ + yyMMdd_HHmmss_fffffff + .pcap
    constexpr size_t stamp_len = 21;
    if (name.size() != SEGMENT_PREFIX.size() + stamp_len + STORE_EXTENSION.size() ||
        !name.starts_with(SEGMENT_PREFIX) || !name.ends_with(STORE_EXTENSION)) {
        return std::nullopt;
    }
    std::string_view stamp = name.substr(SEGMENT_PREFIX.size(), stamp_len);
    if (stamp[6] != '_' || stamp[13] != '_') {
        return std::nullopt;
    }

    auto digits = [&stamp](size_t pos, size_t count) -> std::optional<uint32_t> {
        uint32_t value = 0;
        for (size_t i = pos; i < pos + count; ++i) {
            char c = stamp[i];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + static_cast<uint32_t>(c - '0');
        }
        return value;
    };

    auto yy = digits(0, 2);
    auto mon = digits(2, 2);
    auto day = digits(4, 2);
    auto hh = digits(7, 2);
    auto mm = digits(9, 2);
    auto ss = digits(11, 2);
    auto ticks = digits(14, 7);
    if (!yy || !mon || !day || !hh || !mm || !ss || !ticks) {
        return std::nullopt;
    }
    if (*mon < 1 || *mon > 12 || *day < 1 || *day > 31 || *hh > 23 || *mm > 59 || *ss > 60) {
        return std::nullopt;
    }

    std::tm utc{};
    utc.tm_year = static_cast<int>(*yy) + 100; // years since 1900, two-digit year is 20yy
    utc.tm_mon = static_cast<int>(*mon) - 1;
    utc.tm_mday = static_cast<int>(*day);
    utc.tm_hour = static_cast<int>(*hh);
    utc.tm_min = static_cast<int>(*mm);
    utc.tm_sec = static_cast<int>(*ss);
    std::time_t secs = ::timegm(&utc);
    if (secs < 0) {
        return std::nullopt;
    }
    return Timestamp(static_cast<uint32_t>(secs), *ticks * SEGMENT_NAME_TICK_NS);
}

/**
 * @brief List segment files in a directory, ordered by the timestamp in their names
 *
 * Files that do not follow the segment naming pattern are ignored. Ties (which a single
 * writer never produces) are broken by file name.
 */
[[nodiscard]] inline Result<std::vector<std::filesystem::path>>
list_segment_files(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return make_error(ErrorCode::io_error, "cannot list segment directory", dir, -1,
                          ec.value());
    }

    std::vector<std::pair<Timestamp, std::filesystem::path>> found;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        auto name = it->path().filename().string();
        if (auto ts = parse_segment_file_name(name)) {
            found.emplace_back(*ts, it->path());
        }
    }
    if (ec) {
        return make_error(ErrorCode::io_error, "error while listing segment directory", dir, -1,
                          ec.value());
    }

    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first < b.first;
        }
        return a.second.filename() < b.second.filename();
    });

    std::vector<std::filesystem::path> out;
    out.reserve(found.size());
    for (auto& [ts, path] : found) {
        out.push_back(std::move(path));
    }
    return out;
}

} // namespace pcapstore::io
