#include "wlm/util/unicode.hpp"

#include <unicode/utf8.h>

namespace wlm::util {

namespace {

constexpr UChar32 kReplacementChar = 0xFFFD;

}  // namespace

CodePoints Unicode::decode(std::string_view text) {
    CodePoints result;
    result.reserve(text.size());

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.size());
    int32_t idx = 0;

    while (idx < length) {
        UChar32 codepoint;
        U8_NEXT(bytes, idx, length, codepoint);
        result.push_back(codepoint < 0 ? kReplacementChar : codepoint);
    }

    return result;
}

std::string Unicode::encode(const CodePoints& code_points) {
    std::string result;
    result.reserve(code_points.size());
    for (UChar32 codepoint : code_points) {
        append(result, codepoint);
    }
    return result;
}

void Unicode::append(std::string& out, UChar32 codepoint) {
    uint8_t buffer[U8_MAX_LENGTH];
    int32_t offset = 0;
    UBool is_error = false;
    U8_APPEND(buffer, offset, U8_MAX_LENGTH, codepoint, is_error);
    if (is_error) {
        offset = 0;
        U8_APPEND_UNSAFE(buffer, offset, kReplacementChar);
    }
    out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(offset));
}

size_t Unicode::length(std::string_view text) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.size());
    int32_t idx = 0;
    size_t count = 0;

    while (idx < length) {
        U8_FWD_1(bytes, idx, length);
        ++count;
    }

    return count;
}

Result<std::string> Unicode::normalizeNfkc(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    UErrorCode status = U_ZERO_ERROR;
    const UNormalizer2* normalizer = unorm2_getNFKCInstance(&status);
    if (U_FAILURE(status) || !normalizer) {
        return makeErrorResult<std::string>(ErrorCode::kSystemError,
            "Failed to initialize Unicode normalizer: " + std::string(u_errorName(status)));
    }

    auto utf16_result = utf8ToUtf16(text);
    if (!utf16_result) {
        return std::unexpected(utf16_result.error());
    }

    const std::u16string& input = utf16_result.value();

    // Calculate normalized length
    int32_t norm_length = unorm2_normalize(normalizer,
                                          reinterpret_cast<const UChar*>(input.c_str()),
                                          static_cast<int32_t>(input.length()), nullptr, 0, &status);

    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        return makeErrorResult<std::string>(ErrorCode::kSystemError,
            "Failed to calculate normalized length: " + std::string(u_errorName(status)));
    }

    std::u16string normalized(static_cast<size_t>(norm_length), 0);
    status = U_ZERO_ERROR;

    unorm2_normalize(normalizer,
                     reinterpret_cast<const UChar*>(input.c_str()),
                     static_cast<int32_t>(input.length()),
                     reinterpret_cast<UChar*>(normalized.data()),
                     norm_length, &status);

    if (U_FAILURE(status)) {
        return makeErrorResult<std::string>(ErrorCode::kSystemError,
            "Failed to normalize text: " + std::string(u_errorName(status)));
    }

    return utf16ToUtf8(normalized);
}

Result<std::u16string> Unicode::utf8ToUtf16(const std::string& utf8_text) {
    if (utf8_text.empty()) {
        return std::u16string();
    }

    UErrorCode status = U_ZERO_ERROR;

    int32_t utf16_length = 0;
    u_strFromUTF8(nullptr, 0, &utf16_length, utf8_text.c_str(),
                  static_cast<int32_t>(utf8_text.length()), &status);

    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        return makeErrorResult<std::u16string>(ErrorCode::kValidationError,
            "Failed to calculate UTF-16 length: " + std::string(u_errorName(status)));
    }

    std::u16string result(static_cast<size_t>(utf16_length), 0);
    status = U_ZERO_ERROR;

    u_strFromUTF8(reinterpret_cast<UChar*>(result.data()), utf16_length, nullptr,
                  utf8_text.c_str(), static_cast<int32_t>(utf8_text.length()), &status);

    if (U_FAILURE(status)) {
        return makeErrorResult<std::u16string>(ErrorCode::kValidationError,
            "Failed to convert UTF-8 to UTF-16: " + std::string(u_errorName(status)));
    }

    return result;
}

Result<std::string> Unicode::utf16ToUtf8(const std::u16string& utf16_text) {
    if (utf16_text.empty()) {
        return std::string();
    }

    UErrorCode status = U_ZERO_ERROR;

    int32_t utf8_length = 0;
    u_strToUTF8(nullptr, 0, &utf8_length,
                reinterpret_cast<const UChar*>(utf16_text.c_str()),
                static_cast<int32_t>(utf16_text.length()), &status);

    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        return makeErrorResult<std::string>(ErrorCode::kValidationError,
            "Failed to calculate UTF-8 length: " + std::string(u_errorName(status)));
    }

    std::string result(static_cast<size_t>(utf8_length), 0);
    status = U_ZERO_ERROR;

    u_strToUTF8(result.data(), utf8_length, nullptr,
                reinterpret_cast<const UChar*>(utf16_text.c_str()),
                static_cast<int32_t>(utf16_text.length()), &status);

    if (U_FAILURE(status)) {
        return makeErrorResult<std::string>(ErrorCode::kValidationError,
            "Failed to convert UTF-16 to UTF-8: " + std::string(u_errorName(status)));
    }

    return result;
}

} // namespace wlm::util
