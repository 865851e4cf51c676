/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_PDF_EXTRACTOR_H
#define MAILSIFT_PDF_EXTRACTOR_H

#include "core_export.h"
#include "text_block.h"
#include <vector>

namespace mailsift::pdf
{

/**
 * @brief Extracts the text of every page of a PDF document with PDFium.
 *
 * Produces exactly one text block with the pages joined by '\n'. Throws an error tagged
 * `errors::pdf_decode`, with PDFium's reason, when the document is encrypted or malformed
 * or a page cannot be loaded. Safe to call from several threads; calls into PDFium are
 * serialized.
 */
MAILSIFT_CORE_EXPORT std::vector<text_block> extract(byte_span buffer);

} // namespace mailsift::pdf

#endif // MAILSIFT_PDF_EXTRACTOR_H
