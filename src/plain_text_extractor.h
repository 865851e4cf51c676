/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_PLAIN_TEXT_EXTRACTOR_H
#define MAILSIFT_PLAIN_TEXT_EXTRACTOR_H

#include "core_export.h"
#include "text_block.h"
#include <vector>

namespace mailsift::plain_text
{

/**
 * @brief One text block per line of the buffer, decoded as UTF-8 with invalid sequences
 * replaced by U+FFFD. Never throws an extraction error.
 * @see utf8::split_lines
 */
MAILSIFT_CORE_EXPORT std::vector<text_block> extract(byte_span buffer);

} // namespace mailsift::plain_text

#endif // MAILSIFT_PLAIN_TEXT_EXTRACTOR_H
