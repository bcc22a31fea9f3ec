#include <gtest/gtest.h>

#include <vector>

#include "openmelee/protocol/text_encoding.hpp"

using namespace openmelee::protocol;

namespace {

// "ＴＥＳＴ＃００２" as sent by the game client.
const std::vector<uint8_t> kFullWidthCode = {
    130, 115, 130, 100, 130, 114, 130, 115, 129, 148, 130, 79, 130, 79, 130, 81};

} // namespace

TEST(TextEncodingTest, DecodesFullWidthShiftJis) {
    auto decoded = decodeShiftJis(kFullWidthCode);
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_EQ(decoded.value(), "ＴＥＳＴ＃００２");
}

TEST(TextEncodingTest, DecodesAsciiShiftJis) {
    auto decoded = decodeShiftJis({'T', 'E', 'S', 'T', '#', '0', '0', '1'});
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_EQ(decoded.value(), "TEST#001");
}

TEST(TextEncodingTest, DecodesEmptyInput) {
    auto decoded = decodeShiftJis({});
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_TRUE(decoded.value().empty());
}

TEST(TextEncodingTest, NormalizesFullWidthToAscii) {
    auto normalized = normalizeNfkc("ＴＥＳＴ＃００２");
    ASSERT_TRUE(normalized.hasValue());
    EXPECT_EQ(normalized.value(), "TEST#002");
}

TEST(TextEncodingTest, NormalizationLeavesAsciiUntouched) {
    auto normalized = normalizeNfkc("TEST#001");
    ASSERT_TRUE(normalized.hasValue());
    EXPECT_EQ(normalized.value(), "TEST#001");
}

TEST(TextEncodingTest, EncodesFullWidthBackToClientBytes) {
    auto encoded = encodeShiftJis("ＴＥＳＴ＃００２");
    ASSERT_TRUE(encoded.hasValue());
    EXPECT_EQ(encoded.value(), kFullWidthCode);
}

TEST(TextEncodingTest, UnmappableCharacterFails) {
    // U+1F600 has no Shift_JIS mapping.
    auto encoded = encodeShiftJis("\xF0\x9F\x98\x80");
    ASSERT_TRUE(encoded.hasError());
    EXPECT_EQ(encoded.error().code(), openmelee::foundation::ErrorCode::TextEncodingFailed);
}
