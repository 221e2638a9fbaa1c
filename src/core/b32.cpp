#include <upid/core/b32.hpp>

namespace upid::b32 {

// ---- Bit packing ----
// A sub-field is at most 64 bits, so it is read into a single big-endian
// integer and cut into 5-bit symbols from the most significant end. When the
// width is not a multiple of 5 the final symbol holds the remaining bits
// right-aligned, leaving its top bit(s) as implicit zero padding.

static uint64_t load_be(const Bytes& binary) {
    uint64_t v = 0;
    for (uint8_t b : binary) {
        v = (v << 8) | b;
    }
    return v;
}

static Bytes store_be(uint64_t v, size_t len) {
    Bytes out(len);
    for (size_t i = len; i > 0; --i) {
        out[i - 1] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
    return out;
}

static size_t symbol_count(size_t bits) {
    return (bits + 4) / 5;
}

static std::string pack_symbols(uint64_t v, size_t bits) {
    size_t count = symbol_count(bits);
    size_t tail_bits = bits - 5 * (count - 1);

    std::string out(count, ENCODE[0]);
    for (size_t i = 0; i + 1 < count; ++i) {
        size_t shift = bits - 5 * (i + 1);
        out[i] = ENCODE[(v >> shift) & 0x1F];
    }
    out[count - 1] = ENCODE[v & ((uint64_t{1} << tail_bits) - 1)];
    return out;
}

// Symbols must already be validated against the alphabet.
static uint64_t unpack_symbols(const std::string& encoded, size_t bits) {
    size_t count = encoded.size();
    size_t tail_bits = bits - 5 * (count - 1);

    uint64_t v = 0;
    for (size_t i = 0; i + 1 < count; ++i) {
        v = (v << 5) | decode_char(encoded[i]);
    }
    return (v << tail_bits) | decode_char(encoded[count - 1]);
}

// ---- Validation ----

static Status check_bin_len(const Bytes& binary, size_t want, const char* what) {
    if (binary.size() != want) {
        return UpidError::invalid_input(
            std::string(what) + " has to be exactly " + std::to_string(want) + " bytes long",
            "Got " + std::to_string(binary.size()) + " bytes");
    }
    return ok_status();
}

static Status check_char_len(const std::string& encoded, size_t want, const char* what) {
    if (encoded.size() != want) {
        return UpidError::invalid_input(
            std::string(what) + " has to be exactly " + std::to_string(want) + " characters long",
            "Got " + std::to_string(encoded.size()) + " characters");
    }
    return ok_status();
}

static Status check_alphabet(const std::string& encoded, const char* what) {
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (!is_valid_char(encoded[i])) {
            return UpidError::invalid_input(
                std::string(what) + " can only consist of characters in " + ENCODE,
                std::string("Invalid char '") + encoded[i] + "' at position " + std::to_string(i));
        }
    }
    return ok_status();
}

// A final symbol above 15 sets the padding bit, which no encoder produces and
// which would spill into the neighbouring field once reassembled.
static Status check_overflow(const std::string& encoded, const char* what) {
    char last = encoded.back();
    if (decode_char(last) > MAX_PADDED_SYMBOL) {
        return UpidError::invalid_input(
            std::string(what) + " '" + encoded + "' overflows 128 bits",
            std::string("Final character must be at most '") + ENCODE[MAX_PADDED_SYMBOL]
                + "', got '" + last + "'");
    }
    return ok_status();
}

// ---- Sub-fields ----

Result<std::string> encode_time(const Bytes& binary) {
    UPID_TRY(check_bin_len(binary, TIME_BIN_LEN, "Timestamp value"));
    return Result<std::string>::ok(pack_symbols(load_be(binary), TIME_BIN_LEN * 8));
}

Result<Bytes> decode_time(const std::string& encoded) {
    UPID_TRY(check_char_len(encoded, TIME_CHAR_LEN, "UPID timestamp"));
    UPID_TRY(check_alphabet(encoded, "UPID timestamp"));
    return Result<Bytes>::ok(
        store_be(unpack_symbols(encoded, TIME_BIN_LEN * 8), TIME_BIN_LEN));
}

Result<std::string> encode_rando(const Bytes& binary) {
    UPID_TRY(check_bin_len(binary, RANDO_BIN_LEN, "Randomness value"));
    return Result<std::string>::ok(pack_symbols(load_be(binary), RANDO_BIN_LEN * 8));
}

Result<Bytes> decode_rando(const std::string& encoded) {
    UPID_TRY(check_char_len(encoded, RANDO_CHAR_LEN, "UPID randomness"));
    UPID_TRY(check_alphabet(encoded, "UPID randomness"));
    UPID_TRY(check_overflow(encoded, "Random value"));
    return Result<Bytes>::ok(
        store_be(unpack_symbols(encoded, RANDO_BIN_LEN * 8), RANDO_BIN_LEN));
}

Result<PrefixText> encode_prefix(const Bytes& binary) {
    UPID_TRY(check_bin_len(binary, PREFIX_BIN_LEN, "Prefix value"));
    std::string packed = pack_symbols(load_be(binary), PREFIX_BIN_LEN * 8);

    PrefixText out;
    out.prefix = packed.substr(0, PREFIX_CHAR_LEN);
    out.version = packed[PREFIX_CHAR_LEN];
    return Result<PrefixText>::ok(std::move(out));
}

Result<Bytes> decode_prefix(const std::string& encoded) {
    UPID_TRY(check_char_len(encoded, PREFIX_CHAR_LEN + VERSION_CHAR_LEN,
                            "UPID prefix with version"));
    UPID_TRY(check_alphabet(encoded, "UPID prefix"));
    UPID_TRY(check_overflow(encoded, "Prefix value"));
    return Result<Bytes>::ok(
        store_be(unpack_symbols(encoded, PREFIX_BIN_LEN * 8), PREFIX_BIN_LEN));
}

// ---- Whole identifier ----

Result<std::string> encode(const Bytes& binary) {
    UPID_TRY(check_bin_len(binary, BIN_LEN, "UPID"));

    Bytes time(binary.begin(), binary.begin() + TIME_BIN_LEN);
    Bytes rando(binary.begin() + TIME_BIN_LEN, binary.begin() + END_RANDO_BIN);
    Bytes prefix(binary.begin() + END_RANDO_BIN, binary.end());

    auto t = encode_time(time);
    UPID_TRY(t);
    auto r = encode_rando(rando);
    UPID_TRY(r);
    auto p = encode_prefix(prefix);
    UPID_TRY(p);

    std::string out;
    out.reserve(TEXT_LEN);
    out += p.value().prefix;
    out += SEPARATOR;
    out += t.value();
    out += r.value();
    out += p.value().version;
    return Result<std::string>::ok(std::move(out));
}

Result<Bytes> decode(const std::string& encoded) {
    std::string stripped;
    stripped.reserve(encoded.size());
    for (char c : encoded) {
        if (c != SEPARATOR) stripped += c;
    }

    // Fail fast on the whole string before slicing it up
    UPID_TRY(check_char_len(stripped, CHAR_LEN, "Encoded UPID"));
    UPID_TRY(check_alphabet(stripped, "Encoded UPID"));

    // Text regions do not line up with binary regions: the version char
    // trails the string but is packed with the prefix.
    auto prefix = decode_prefix(stripped.substr(0, PREFIX_CHAR_LEN) + stripped.back());
    UPID_TRY(prefix);
    auto time = decode_time(stripped.substr(PREFIX_CHAR_LEN, TIME_CHAR_LEN));
    UPID_TRY(time);
    auto rando = decode_rando(stripped.substr(END_TIME_CHAR, RANDO_CHAR_LEN));
    UPID_TRY(rando);

    Bytes out;
    out.reserve(BIN_LEN);
    out.insert(out.end(), time.value().begin(), time.value().end());
    out.insert(out.end(), rando.value().begin(), rando.value().end());
    out.insert(out.end(), prefix.value().begin(), prefix.value().end());
    return Result<Bytes>::ok(std::move(out));
}

} // namespace upid::b32
