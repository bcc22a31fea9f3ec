#pragma once

/// @file text_encoding.hpp
/// @brief Legacy Shift_JIS conversion and Unicode normalization (ICU).
///
/// Clients send the target connect code as the raw bytes of the game's
/// Shift_JIS string, typically full-width ("ＴＥＳＴ＃００２"). Codes are
/// compared after NFKC normalization so that full-width and ASCII
/// spellings of the same code are equal.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "openmelee/foundation/game_result.hpp"

namespace openmelee::protocol {

/// Decode Shift_JIS bytes to UTF-8. Invalid sequences become U+FFFD.
[[nodiscard]] foundation::GameResult<std::string>
decodeShiftJis(const std::vector<uint8_t>& bytes);

/// Encode UTF-8 text to Shift_JIS bytes.
[[nodiscard]] foundation::GameResult<std::vector<uint8_t>>
encodeShiftJis(std::string_view utf8);

/// Apply NFKC (compatibility composition) to UTF-8 text.
[[nodiscard]] foundation::GameResult<std::string>
normalizeNfkc(std::string_view utf8);

} // namespace openmelee::protocol
