/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_EXTRACTOR_H
#define MAILSIFT_EXTRACTOR_H

#include "core_export.h"
#include "format_tag.h"
#include "text_block.h"
#include <vector>

namespace mailsift
{

/**
 * @brief Extracts text blocks from the buffer with the strategy for the format.
 *
 * The buffer is borrowed for the duration of the call only.
 *
 * @throw errors::base tagged `errors::unsupported_format` for format_tag::unsupported, and
 * with the tags documented by `pdf::extract` and `zip_archive::extract` for their formats.
 * Plain text extraction does not fail.
 * @see content_type::classify
 */
MAILSIFT_CORE_EXPORT std::vector<text_block> extract(format_tag tag, byte_span buffer);

} // namespace mailsift

#endif // MAILSIFT_EXTRACTOR_H
