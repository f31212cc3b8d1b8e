#pragma once

#include <chrono>
#include <compare>

#include <cstdint>

namespace pcapstore {

/**
 * UTC instant with nanosecond resolution.
 *
 * ## Storage
 * 8 bytes: uint32_t seconds since the Unix epoch + uint32_t nanoseconds.
 * Matches the packet header wire format exactly.
 *
 * ## Normalization
 * Nanoseconds are always kept in [0, 999'999'999]. Excess nanoseconds passed to the
 * constructor carry into seconds. Conversions from chrono clamp pre-epoch times to zero
 * and post-2106 times to the maximum representable instant.
 */
class Timestamp {
public:
    static constexpr uint32_t NANOSECONDS_PER_SECOND = 1'000'000'000U;
    static constexpr uint32_t MAX_NANOSECONDS = NANOSECONDS_PER_SECOND - 1;

    constexpr Timestamp() noexcept = default;

    constexpr Timestamp(uint32_t sec, uint32_t nsec) noexcept : seconds_(sec), nanoseconds_(nsec) {
        normalize();
    }

    [[nodiscard]] constexpr uint32_t seconds() const noexcept { return seconds_; }
    [[nodiscard]] constexpr uint32_t nanoseconds() const noexcept { return nanoseconds_; }

    /**
     * @brief Nanoseconds since the Unix epoch
     */
    [[nodiscard]] constexpr int64_t total_nanoseconds() const noexcept {
        return static_cast<int64_t>(seconds_) * NANOSECONDS_PER_SECOND + nanoseconds_;
    }

    constexpr auto operator<=>(const Timestamp&) const noexcept = default;

    static Timestamp now() noexcept { return from_chrono(std::chrono::system_clock::now()); }

    static constexpr Timestamp from_seconds(uint32_t seconds) noexcept {
        return Timestamp(seconds, 0);
    }

    static constexpr Timestamp from_nanoseconds(std::chrono::nanoseconds since_epoch) noexcept {
        int64_t total = since_epoch.count();
        if (total <= 0) {
            return Timestamp{};
        }
        int64_t secs = total / NANOSECONDS_PER_SECOND;
        if (secs > static_cast<int64_t>(UINT32_MAX)) {
            return max();
        }
        return Timestamp(static_cast<uint32_t>(secs),
                         static_cast<uint32_t>(total % NANOSECONDS_PER_SECOND));
    }

    static Timestamp from_chrono(std::chrono::system_clock::time_point tp) noexcept {
        return from_nanoseconds(
            std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()));
    }

    [[nodiscard]] constexpr std::chrono::nanoseconds to_nanoseconds() const noexcept {
        return std::chrono::nanoseconds{total_nanoseconds()};
    }

    [[nodiscard]] std::chrono::system_clock::time_point to_chrono() const noexcept {
        return std::chrono::system_clock::time_point{
            std::chrono::duration_cast<std::chrono::system_clock::duration>(to_nanoseconds())};
    }

    static constexpr Timestamp max() noexcept { return Timestamp(UINT32_MAX, MAX_NANOSECONDS); }

    /**
     * @brief Offset by a signed duration, saturating at zero and max()
     */
    [[nodiscard]] constexpr Timestamp offset_by(std::chrono::nanoseconds delta) const noexcept {
        int64_t base = total_nanoseconds();
        int64_t d = delta.count();
        if (d < 0 && base < -d) {
            return Timestamp{};
        }
        if (d > 0 && max().total_nanoseconds() - base < d) {
            return max();
        }
        return from_nanoseconds(std::chrono::nanoseconds{base + d});
    }

    /**
     * @brief Signed difference (this - other)
     */
    [[nodiscard]] constexpr std::chrono::nanoseconds operator-(const Timestamp& other) const noexcept {
        return std::chrono::nanoseconds{total_nanoseconds() - other.total_nanoseconds()};
    }

private:
    constexpr void normalize() noexcept {
        if (nanoseconds_ >= NANOSECONDS_PER_SECOND) {
            uint32_t carry = nanoseconds_ / NANOSECONDS_PER_SECOND;
            nanoseconds_ %= NANOSECONDS_PER_SECOND;
            if (seconds_ > UINT32_MAX - carry) {
                seconds_ = UINT32_MAX;
                nanoseconds_ = MAX_NANOSECONDS;
            } else {
                seconds_ += carry;
            }
        }
    }

    uint32_t seconds_{0};
    uint32_t nanoseconds_{0};
};

} // namespace pcapstore
