/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_ERROR_TAGS_H
#define MAILSIFT_ERROR_TAGS_H

#include <string_view>

/**
 * @brief Tags naming the kind of an error. Pass one to `make_error` and test for it with
 * `errors::contains_type<Tag>`.
 */
namespace mailsift::errors
{

/// @brief The signature was recognized but the format is not one that text can be extracted from.
struct unsupported_format { static constexpr std::string_view string() { return "unsupported format"; } };

/// @brief The buffer carries a zip signature but cannot be opened as a zip archive.
struct archive_open { static constexpr std::string_view string() { return "archive open failure"; } };

/// @brief An archive member cannot be read or is not valid UTF-8.
struct member_read { static constexpr std::string_view string() { return "archive member read failure"; } };

/// @brief Text cannot be extracted from a PDF document (encrypted, malformed or decoder failure).
struct pdf_decode { static constexpr std::string_view string() { return "PDF decode failure"; } };

struct file_not_found { static constexpr std::string_view string() { return "file not found"; } };

struct file_read { static constexpr std::string_view string() { return "file read failure"; } };

struct input_too_large { static constexpr std::string_view string() { return "input too large"; } };

struct output_write { static constexpr std::string_view string() { return "output write failure"; } };

/// @brief A command line option or environment variable has an invalid value.
struct invalid_argument { static constexpr std::string_view string() { return "invalid argument"; } };

} // namespace mailsift::errors

#endif // MAILSIFT_ERROR_TAGS_H
