#pragma once

#include <upid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Base32 codec for the UPID layout.
//
// Binary order is TIME | RANDO | PREFIX+VERSION, string order is
// PREFIX _ TIME RANDO VERSION. Each sub-field is encoded on its own so the
// prefix can be read back without touching the rest of the value.
namespace upid::b32 {

using Bytes = std::vector<uint8_t>;

// ---- binary layout ----
constexpr size_t TIME_BIN_LEN = 5;
constexpr size_t RANDO_BIN_LEN = 8;
constexpr size_t PREFIX_BIN_LEN = 3;  // includes the 4-bit version
constexpr size_t END_RANDO_BIN = TIME_BIN_LEN + RANDO_BIN_LEN;
constexpr size_t BIN_LEN = END_RANDO_BIN + PREFIX_BIN_LEN;

// ---- text layout ----
constexpr size_t PREFIX_CHAR_LEN = 4;  // excluding the version char
constexpr size_t TIME_CHAR_LEN = 8;
constexpr size_t RANDO_CHAR_LEN = 13;
constexpr size_t VERSION_CHAR_LEN = 1;
constexpr size_t END_TIME_CHAR = PREFIX_CHAR_LEN + TIME_CHAR_LEN;
constexpr size_t CHAR_LEN = END_TIME_CHAR + RANDO_CHAR_LEN + VERSION_CHAR_LEN;
constexpr size_t TEXT_LEN = CHAR_LEN + 1;  // with separator
constexpr char SEPARATOR = '_';

// Digits first so encoded values sort sensibly, then the full lower-case
// latin alphabet so any four-letter prefix can be written.
inline constexpr char ENCODE[] = "234567abcdefghijklmnopqrstuvwxyz";
constexpr size_t ALPHABET_LEN = sizeof(ENCODE) - 1;

// Inverse table marker for bytes outside the alphabet.
constexpr uint8_t INVALID = 255;

// Largest final-symbol value for a padded sub-field: only 4 of its 5 bits
// carry data, the top bit must stay clear.
constexpr uint8_t MAX_PADDED_SYMBOL = 15;

constexpr std::array<uint8_t, 256> make_decode_table() {
    std::array<uint8_t, 256> table{};
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = INVALID;
    }
    for (size_t i = 0; i < ALPHABET_LEN; ++i) {
        table[static_cast<unsigned char>(ENCODE[i])] = static_cast<uint8_t>(i);
    }
    return table;
}

// O(1) lookup: ascii byte -> alphabet index, or INVALID
inline constexpr std::array<uint8_t, 256> DECODE = make_decode_table();

inline uint8_t decode_char(char c) {
    return DECODE[static_cast<unsigned char>(c)];
}

inline bool is_valid_char(char c) {
    return decode_char(c) != INVALID;
}

struct PrefixText {
    std::string prefix;  // PREFIX_CHAR_LEN characters
    char version = ENCODE[0];
};

// Whole identifier: 16 bytes <-> "pppp_tttttttttrrrrrrrrrrrrrv"
Result<std::string> encode(const Bytes& binary);
Result<Bytes> decode(const std::string& encoded);

// 40 bits <-> 8 symbols, no padding
Result<std::string> encode_time(const Bytes& binary);
Result<Bytes> decode_time(const std::string& encoded);

// 64 bits <-> 13 symbols, one padding bit
Result<std::string> encode_rando(const Bytes& binary);
Result<Bytes> decode_rando(const std::string& encoded);

// 24 bits <-> 4 prefix symbols + 1 version symbol, one padding bit.
// decode_prefix takes the prefix and version characters together.
Result<PrefixText> encode_prefix(const Bytes& binary);
Result<Bytes> decode_prefix(const std::string& encoded);

} // namespace upid::b32
