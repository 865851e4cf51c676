/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_LOG_TAGS_H
#define MAILSIFT_LOG_TAGS_H

#include <string_view>

namespace mailsift::log
{

/**
 * @brief Tag for operational events of the mailsift program (input read, format detected, result written).
 *
 * Entries carrying it are kept in release builds, where all other entries compile out.
 */
struct audit { static constexpr std::string_view string() { return "audit"; } };

struct scope_enter { static constexpr std::string_view string() { return "scope_enter"; } };

struct scope_exit { static constexpr std::string_view string() { return "scope_exit"; } };

} // namespace mailsift::log

#endif // MAILSIFT_LOG_TAGS_H
