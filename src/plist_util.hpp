#ifndef PLISTKIT_UTIL_HPP
#define PLISTKIT_UTIL_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "plist_value.hpp"

namespace plistkit {

/**
 * @defgroup Utilities Utility Functions
 * @brief Text conversions shared by the decoders and the encoder.
 * @{
 */

/// Format used by <date> elements, e.g. 2010-05-01T12:00:00Z.
inline constexpr const char* PLIST_DATE_FORMAT = "%Y-%m-%dT%H:%M:%SZ";

/**
 * @brief Encode binary data as base64 (no line breaks).
 */
std::string base64_encode(const uint8_t* data, size_t len);

/**
 * @brief Decode base64 text.
 *
 * Whitespace is skipped so that line-wrapped <data> bodies decode. Decoding
 * stops at the first '=' padding character.
 *
 * @throws MalformedPlistError on a character outside the base64 alphabet
 */
Data base64_decode(std::string_view text);

/**
 * @brief Escape &, < and > for element content.
 */
std::string encode_xml_entities(std::string_view text);

/**
 * @brief Parse a PLIST_DATE_FORMAT timestamp as UTC.
 *
 * @throws MalformedPlistError if the text does not match or names an invalid day
 */
Date parse_date(std::string_view text);

/**
 * @brief Format a timestamp with PLIST_DATE_FORMAT.
 */
std::string format_date(Date date);

/**
 * @brief Convert big-endian UTF-16 code units to UTF-8.
 *
 * Unpaired surrogates are replaced with U+FFFD.
 *
 * @param data Pointer to 2 * @p units bytes
 * @param units Number of UTF-16 code units
 */
std::string utf16be_to_utf8(const uint8_t* data, size_t units);

/** @} */

}  // namespace plistkit

#endif  // PLISTKIT_UTIL_HPP
