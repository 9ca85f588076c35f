/**
 * @file LzStringEncoder.hpp
 * @brief PayloadEncoder producing the compressed payload the z-apps decode.
 */

#pragma once

#include "domain/PayloadEncoder.hpp"
#include <string>

namespace zlinker::infrastructure {

/**
 * @class LzStringEncoder
 * @brief LZ-string base64 compression made URL-safe and reversed.
 *
 * Steps: XML character references for non-ASCII text, LZ-string
 * compressToBase64, '+' -> '-', '/' -> '_', padding dropped, string reversed.
 */
class LzStringEncoder : public domain::PayloadEncoder {
public:
    std::string encode(const std::string& text) const override;

    /** @brief Replaces every non-ASCII code point of UTF-8 text with "&#N;". */
    static std::string EscapeNonAscii(const std::string& utf8);

    /** @brief LZ-string compressToBase64 of an ASCII string, '=' padded. */
    static std::string CompressToBase64(const std::string& ascii);
};

} // namespace zlinker::infrastructure
