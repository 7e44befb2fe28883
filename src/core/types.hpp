#pragma once

#include <array>
#include <charconv>
#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace lantern {

/**
 * Uuid - 128-bit row identifier for devices and notifications.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Random (version 4) UUID.
     */
    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t half = 0; half < 2; ++half) {
            uint64_t word = dist(gen);
            for (size_t i = 0; i < 8; ++i) {
                bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
            }
        }

        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;

        return Uuid(bytes);
    }

    /**
     * Parse hyphenated or bare hex form.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        std::string clean;
        clean.reserve(32);
        for (char c : str) {
            if (c != '-') clean += c;
        }
        if (clean.size() != 32) return std::nullopt;

        Bytes bytes;
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            const char* first = clean.data() + i * 2;
            unsigned value = 0;
            auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
            if (ec != std::errc{} || ptr != first + 2) return std::nullopt;
            bytes[i] = static_cast<uint8_t>(value);
        }
        return Uuid(bytes);
    }

    /**
     * Lower-case hyphenated form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch, the unit stored in SQLite.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}
    explicit Timestamp(TimePoint tp) noexcept
        : millis_(tp.time_since_epoch().count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * ISO 8601 in UTC with millisecond precision.
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = Clock::to_time_t(to_time_point());
        std::tm utc{};
        gmtime_r(&time_t, &utc);

        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

} // namespace lantern

namespace std {
    template<>
    struct hash<lantern::Uuid> {
        size_t operator()(const lantern::Uuid& uuid) const noexcept {
            size_t h = 0;
            for (auto b : uuid.bytes()) {
                h ^= static_cast<size_t>(b) + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
