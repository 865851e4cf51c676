/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_FORMAT_TAG_H
#define MAILSIFT_FORMAT_TAG_H

namespace mailsift
{

/**
 * @brief Extraction strategy a buffer is handled with.
 *
 * zip_archive covers generic zip files and the zip based office formats (docx, xlsx, pptx,
 * odt, ods, odp). unsupported is a recognized signature of a format text is not extracted
 * from; a buffer with no recognized signature at all is plain_text.
 */
enum class format_tag
{
	plain_text,
	pdf,
	zip_archive,
	unsupported
};

} // namespace mailsift

#endif // MAILSIFT_FORMAT_TAG_H
