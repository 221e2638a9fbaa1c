#pragma once

#include <upid/result.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace upid {

// A standard 128-bit UUID. Only the canonical text form is provided; a Upid
// converts to and from this type without touching the bytes.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lower-case
    std::string to_string() const;
    static Result<Uuid> from_string(const std::string& s);

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

} // namespace upid
