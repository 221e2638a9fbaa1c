#pragma once

#include <upid/result.hpp>
#include <upid/core/uuid.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace upid {

using uint128 = unsigned __int128;

// A 128-bit identifier that sorts by creation time and carries a readable
// four-character prefix, e.g. "user_2accvpp5guht4dts56je5a".
//
// Binary layout (big-endian):
//   bytes  0..4   milliseconds since the Unix epoch >> 8 (about 256ms precision)
//   bytes  5..12  random
//   bytes 13..15  20-bit prefix + 4-bit version
//
// Values are immutable; equality, ordering and hashing compare the raw bytes.
class Upid {
public:
    using Bytes = std::array<uint8_t, 16>;
    using Clock = std::chrono::system_clock;
    // Millisecond ticks cover the whole 48-bit timestamp range
    using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;

    // Version symbol packed after the prefix. Restricted to the first half of
    // the alphabet so it fits in 4 bits.
    static constexpr char VERSION = 'a';
    // Filler for short or invalid prefixes
    static constexpr char PREFIX_FILL = 'z';

    Upid() = default;

    // ---- Construction ----

    // Current wall-clock time
    static Upid from_prefix(const std::string& prefix);
    static Upid from_prefix_and_milliseconds(const std::string& prefix, uint64_t milliseconds);
    // Times before the epoch are clamped to it
    static Upid from_prefix_and_datetime(const std::string& prefix, Clock::time_point datetime);

    static Result<Upid> from_string(const std::string& encoded);
    static Upid from_bytes(const Bytes& bytes);
    static Result<Upid> from_bytes(const std::vector<uint8_t>& bytes);
    static Upid from_integer(uint128 value);
    static Upid from_uuid(const Uuid& uuid);

    // Pads with PREFIX_FILL to four characters, clips longer input, and
    // replaces characters outside the alphabet with PREFIX_FILL.
    static std::string normalize_prefix(const std::string& prefix);

    // ---- Accessors ----

    std::string prefix() const;
    char version() const;

    // Recovered time: the dropped low byte reads back as zero, so this is
    // never later than the construction time and at most 255ms earlier.
    uint64_t milliseconds() const;
    TimePoint datetime() const;
    // 2024-07-09T23:48:21.888Z
    std::string datetime_string() const;

    const Bytes& bytes() const { return bytes_; }
    std::string hex() const;
    uint128 as_integer() const;
    Uuid to_uuid() const;

    std::string to_string() const;

    // ---- Comparison ----

    // <0, 0, >0 by lexicographic byte order
    int compare(const Upid& other) const;
    size_t hash() const;

    bool operator==(const Upid& other) const { return compare(other) == 0; }
    bool operator!=(const Upid& other) const { return compare(other) != 0; }
    bool operator<(const Upid& other) const { return compare(other) < 0; }
    bool operator<=(const Upid& other) const { return compare(other) <= 0; }
    bool operator>(const Upid& other) const { return compare(other) > 0; }
    bool operator>=(const Upid& other) const { return compare(other) >= 0; }

private:
    explicit Upid(const Bytes& bytes) : bytes_(bytes) {}

    Bytes bytes_{};
};

} // namespace upid

namespace std {
template<>
struct hash<upid::Upid> {
    size_t operator()(const upid::Upid& u) const { return u.hash(); }
};
} // namespace std
