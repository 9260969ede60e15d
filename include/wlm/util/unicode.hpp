#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <unicode/uchar.h>
#include <unicode/ustring.h>
#include <unicode/unorm2.h>
#include "wlm/common.hpp"

namespace wlm::util {

using CodePoints = std::vector<UChar32>;

/**
 * @brief Unicode text handling with ICU library support
 *
 * Candidates are built from UTF-8 words. Case mapping and classification
 * work on single code points so that a transformed string keeps a 1:1
 * position mapping to its source.
 */
class Unicode {
public:
    /**
     * @brief Decode UTF-8 into code points
     * @param text UTF-8 encoded text
     * @return Code points; ill-formed sequences become U+FFFD
     */
    static CodePoints decode(std::string_view text);

    /**
     * @brief Encode code points as UTF-8
     */
    static std::string encode(const CodePoints& code_points);

    /**
     * @brief Append a single code point to a UTF-8 string
     */
    static void append(std::string& out, UChar32 codepoint);

    /**
     * @brief Number of code points in UTF-8 text
     */
    static size_t length(std::string_view text);

    /**
     * @brief Apply NFKC normalization to UTF-8 text
     * @param text UTF-8 encoded text
     * @return Normalized text or error
     */
    static Result<std::string> normalizeNfkc(const std::string& text);

    static UChar32 toUpper(UChar32 codepoint) { return u_toupper(codepoint); }
    static UChar32 toLower(UChar32 codepoint) { return u_tolower(codepoint); }
    static UChar32 toTitle(UChar32 codepoint) { return u_totitle(codepoint); }

    static bool isUpper(UChar32 codepoint) { return u_isupper(codepoint); }
    static bool isLower(UChar32 codepoint) { return u_islower(codepoint); }
    static bool isAlnum(UChar32 codepoint) { return u_isalnum(codepoint); }
    static bool isWhitespace(UChar32 codepoint) { return u_isUWhiteSpace(codepoint); }

private:
    static Result<std::u16string> utf8ToUtf16(const std::string& utf8_text);
    static Result<std::string> utf16ToUtf8(const std::u16string& utf16_text);
};

} // namespace wlm::util
