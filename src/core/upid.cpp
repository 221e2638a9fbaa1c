#include <upid/core/upid.hpp>
#include <upid/core/b32.hpp>
#include <upid/log.hpp>
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <random>
#include <string_view>

namespace upid {

static_assert(b32::BIN_LEN == sizeof(Upid::Bytes), "UPID is 16 bytes");

// ---- RNG: /dev/urandom with std::random_device fallback ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    log::warn("/dev/urandom unavailable, falling back to std::random_device");
    std::random_device rd;
    for (size_t i = 0; i < len; i += 4) {
        uint32_t word = rd();
        for (size_t j = 0; j < 4 && i + j < len; ++j) {
            buf[i + j] = static_cast<uint8_t>(word >> (8 * j));
        }
    }
}

static b32::Bytes slice(const Upid::Bytes& bytes, size_t begin, size_t end) {
    return b32::Bytes(bytes.begin() + begin, bytes.begin() + end);
}

// ---- Construction ----

std::string Upid::normalize_prefix(const std::string& prefix) {
    std::string out = prefix.substr(0, b32::PREFIX_CHAR_LEN);
    for (char& c : out) {
        if (!b32::is_valid_char(c)) c = PREFIX_FILL;
    }
    out.resize(b32::PREFIX_CHAR_LEN, PREFIX_FILL);
    if (out != prefix) {
        log::debug("prefix '%s' normalized to '%s'", prefix.c_str(), out.c_str());
    }
    return out;
}

Upid Upid::from_prefix(const std::string& prefix) {
    return from_prefix_and_datetime(prefix, Clock::now());
}

Upid Upid::from_prefix_and_datetime(const std::string& prefix, Clock::time_point datetime) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        datetime.time_since_epoch()).count();
    if (ms < 0) {
        log::debug("datetime before the Unix epoch, clamping to 0");
        ms = 0;
    }
    return from_prefix_and_milliseconds(prefix, static_cast<uint64_t>(ms));
}

Upid Upid::from_prefix_and_milliseconds(const std::string& prefix, uint64_t milliseconds) {
    Bytes bytes{};

    // Drop the low byte: 256ms precision buys room for the prefix
    uint64_t time_bits = milliseconds >> 8;
    for (size_t i = 0; i < b32::TIME_BIN_LEN; ++i) {
        bytes[b32::TIME_BIN_LEN - 1 - i] = static_cast<uint8_t>(time_bits >> (8 * i));
    }

    fill_random_bytes(bytes.data() + b32::TIME_BIN_LEN, b32::RANDO_BIN_LEN);

    // Normalized prefix is in the alphabet and VERSION is below the padding
    // limit, so decoding cannot fail here.
    auto packed = b32::decode_prefix(normalize_prefix(prefix) + VERSION);
    const b32::Bytes& p = packed.value();
    std::copy(p.begin(), p.end(), bytes.begin() + b32::END_RANDO_BIN);

    return Upid(bytes);
}

Result<Upid> Upid::from_string(const std::string& encoded) {
    return b32::decode(encoded).map([](b32::Bytes& raw) {
        Bytes bytes{};
        std::copy(raw.begin(), raw.end(), bytes.begin());
        return Upid(bytes);
    });
}

Upid Upid::from_bytes(const Bytes& bytes) {
    return Upid(bytes);
}

Result<Upid> Upid::from_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != b32::BIN_LEN) {
        return UpidError::invalid_input(
            "UPID has to be exactly " + std::to_string(b32::BIN_LEN) + " bytes long",
            "Got " + std::to_string(bytes.size()) + " bytes");
    }
    Bytes out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return Result<Upid>::ok(Upid(out));
}

Upid Upid::from_integer(uint128 value) {
    Bytes bytes{};
    for (size_t i = bytes.size(); i > 0; --i) {
        bytes[i - 1] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return Upid(bytes);
}

Upid Upid::from_uuid(const Uuid& uuid) {
    return Upid(uuid.bytes);
}

// ---- Accessors ----
// Sub-field slices have fixed lengths, so the encoders below cannot fail.

std::string Upid::prefix() const {
    return b32::encode_prefix(slice(bytes_, b32::END_RANDO_BIN, b32::BIN_LEN)).value().prefix;
}

char Upid::version() const {
    return b32::encode_prefix(slice(bytes_, b32::END_RANDO_BIN, b32::BIN_LEN)).value().version;
}

uint64_t Upid::milliseconds() const {
    uint64_t time_bits = 0;
    for (size_t i = 0; i < b32::TIME_BIN_LEN; ++i) {
        time_bits = (time_bits << 8) | bytes_[i];
    }
    return time_bits << 8;
}

Upid::TimePoint Upid::datetime() const {
    return TimePoint(std::chrono::milliseconds(static_cast<int64_t>(milliseconds())));
}

std::string Upid::datetime_string() const {
    uint64_t ms = milliseconds();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);

    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &secs);
#else
    gmtime_r(&secs, &tm);
#endif

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03uZ", date, static_cast<unsigned>(ms % 1000));
    return out;
}

std::string Upid::hex() const {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes_.size() * 2);
    for (uint8_t b : bytes_) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

uint128 Upid::as_integer() const {
    uint128 value = 0;
    for (uint8_t b : bytes_) {
        value = (value << 8) | b;
    }
    return value;
}

Uuid Upid::to_uuid() const {
    Uuid u;
    u.bytes = bytes_;
    return u;
}

std::string Upid::to_string() const {
    return b32::encode(b32::Bytes(bytes_.begin(), bytes_.end())).value();
}

// ---- Comparison ----

int Upid::compare(const Upid& other) const {
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (bytes_[i] != other.bytes_[i]) {
            return bytes_[i] < other.bytes_[i] ? -1 : 1;
        }
    }
    return 0;
}

size_t Upid::hash() const {
    std::string_view raw(reinterpret_cast<const char*>(bytes_.data()), bytes_.size());
    return std::hash<std::string_view>{}(raw);
}

} // namespace upid
