#include <upid/core/uuid.hpp>

namespace upid {

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
    }
    return out;
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.size() != 36) {
        return UpidError::invalid_input(
            "UUID string must be 36 characters",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    for (size_t i = 0; i < s.size(); ++i) {
        if (is_dash_position(i) != (s[i] == '-')) {
            return UpidError::invalid_input(
                "UUID string has invalid dash positions",
                "Expected dashes at positions 8, 13, 18, 23");
        }
    }

    Uuid u;
    size_t byte_idx = 0;
    for (size_t i = 0; i < s.size(); ) {
        if (s[i] == '-') { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return UpidError::invalid_input(
                "UUID string contains invalid hex character",
                "Invalid char at position " + std::to_string(hi < 0 ? i : i + 1));
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

} // namespace upid
