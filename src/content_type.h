/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_CONTENT_TYPE_H
#define MAILSIFT_CONTENT_TYPE_H

#include "core_export.h"
#include "format_tag.h"
#include "mime_type.h"
#include "text_block.h"

/**
 * @brief Content type detection from binary signatures (magic numbers).
 *
 * The file name plays no part. Signatures are tested in a fixed order and the first match
 * wins: office XML documents, open documents, PDF, generic zip, XML and HTML text, then
 * binary formats text is not extracted from. A buffer matching nothing is plain text, since
 * csv, json, txt and similar formats carry no signature.
 */
namespace mailsift::content_type
{

struct signature_match
{
	format_tag tag;
	mime_type type;
};

/**
 * @brief Finds the first matching signature.
 *
 * Total: every buffer, including an empty or truncated one, gets a result, and the same
 * buffer always gets the same result. Only the leading bytes are inspected; a zip signature
 * does not guarantee that the rest of the archive is intact.
 */
MAILSIFT_CORE_EXPORT signature_match detect(byte_span buffer);

/// @brief Tag of the signature `detect` finds.
MAILSIFT_CORE_EXPORT format_tag classify(byte_span buffer);

} // namespace mailsift::content_type

#endif // MAILSIFT_CONTENT_TYPE_H
