/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_UTF8_H
#define MAILSIFT_UTF8_H

#include "core_export.h"
#include <string>
#include <string_view>
#include <vector>

namespace mailsift::utf8
{

/// @brief Unicode replacement character U+FFFD, UTF-8 encoded.
inline constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

/**
 * @brief Decodes UTF-8, replacing every invalid sequence with U+FFFD.
 *
 * Each maximal subpart of an ill-formed sequence (Unicode Table 3-7) becomes one U+FFFD: a byte
 * that cannot start a character, or a lead byte with the continuation bytes that still form a
 * valid prefix. So "\xE2\x82" is one replacement and "\xED\xA0\x80" (a surrogate) is three.
 * Never fails.
 */
MAILSIFT_CORE_EXPORT std::string decode_lossy(std::string_view data);

/// @brief Whether the data is well formed UTF-8 (no overlong forms, surrogates or truncated sequences).
MAILSIFT_CORE_EXPORT bool is_valid(std::string_view data);

/**
 * @brief Splits text into lines at '\n', removing a '\r' before it.
 *
 * A terminator at the very end does not produce an extra empty line and empty text has no lines.
 */
MAILSIFT_CORE_EXPORT std::vector<std::string> split_lines(std::string_view text);

} // namespace mailsift::utf8

#endif // MAILSIFT_UTF8_H
