/// @file text_encoding.cpp
/// @brief Shift_JIS conversion and NFKC normalization on top of ICU.

#include "openmelee/protocol/text_encoding.hpp"

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/ucnv.h>
#include <unicode/ucnv_err.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include <memory>

namespace openmelee::protocol {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr const char* kLegacyCodepage = "Shift_JIS";

using ConverterPtr = std::unique_ptr<UConverter, decltype(&ucnv_close)>;

GameError icuError(std::string_view what, UErrorCode status) {
    std::string message(what);
    message += ": ";
    message += u_errorName(status);
    return GameError(ErrorCode::TextEncodingFailed, std::move(message));
}

GameResult<ConverterPtr> openConverter() {
    UErrorCode status = U_ZERO_ERROR;
    ConverterPtr converter(ucnv_open(kLegacyCodepage, &status), &ucnv_close);
    if (U_FAILURE(status) || !converter) {
        return GameResult<ConverterPtr>::err(icuError("cannot open Shift_JIS converter", status));
    }
    return GameResult<ConverterPtr>::ok(std::move(converter));
}

} // namespace

GameResult<std::string> decodeShiftJis(const std::vector<uint8_t>& bytes) {
    auto converter = openConverter();
    if (!converter) {
        return GameResult<std::string>::err(converter.error());
    }

    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString text(reinterpret_cast<const char*>(bytes.data()),
                            static_cast<int32_t>(bytes.size()),
                            converter.value().get(), status);
    if (U_FAILURE(status)) {
        return GameResult<std::string>::err(icuError("Shift_JIS decode failed", status));
    }

    std::string utf8;
    text.toUTF8String(utf8);
    return GameResult<std::string>::ok(std::move(utf8));
}

GameResult<std::vector<uint8_t>> encodeShiftJis(std::string_view utf8) {
    auto converter = openConverter();
    if (!converter) {
        return GameResult<std::vector<uint8_t>>::err(converter.error());
    }
    UConverter* cnv = converter.value().get();

    // Characters without a Shift_JIS mapping are an error, not '?'.
    UErrorCode status = U_ZERO_ERROR;
    ucnv_setFromUCallBack(cnv, UCNV_FROM_U_CALLBACK_STOP, nullptr,
                          nullptr, nullptr, &status);
    if (U_FAILURE(status)) {
        return GameResult<std::vector<uint8_t>>::err(
            icuError("cannot configure Shift_JIS converter", status));
    }

    auto text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));

    int32_t length = text.extract(nullptr, 0, cnv, status);
    if (status == U_BUFFER_OVERFLOW_ERROR || status == U_STRING_NOT_TERMINATED_WARNING) {
        status = U_ZERO_ERROR;
    }
    if (U_FAILURE(status)) {
        return GameResult<std::vector<uint8_t>>::err(icuError("Shift_JIS encode failed", status));
    }

    std::vector<uint8_t> bytes(static_cast<std::size_t>(length));
    if (length > 0) {
        ucnv_reset(cnv);
        text.extract(reinterpret_cast<char*>(bytes.data()), length, cnv, status);
        if (U_FAILURE(status)) {
            return GameResult<std::vector<uint8_t>>::err(icuError("Shift_JIS encode failed", status));
        }
    }
    return GameResult<std::vector<uint8_t>>::ok(std::move(bytes));
}

GameResult<std::string> normalizeNfkc(std::string_view utf8) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status) || nfkc == nullptr) {
        return GameResult<std::string>::err(icuError("NFKC normalizer unavailable", status));
    }

    auto text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    icu::UnicodeString normalized = nfkc->normalize(text, status);
    if (U_FAILURE(status)) {
        return GameResult<std::string>::err(icuError("NFKC normalization failed", status));
    }

    std::string out;
    normalized.toUTF8String(out);
    return GameResult<std::string>::ok(std::move(out));
}

} // namespace openmelee::protocol
