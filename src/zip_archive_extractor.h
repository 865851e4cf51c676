/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_ZIP_ARCHIVE_EXTRACTOR_H
#define MAILSIFT_ZIP_ARCHIVE_EXTRACTOR_H

#include "core_export.h"
#include "text_block.h"
#include <string_view>
#include <vector>

namespace mailsift::zip_archive
{

/// @brief Whether an archive member's text is extracted: its name ends with ".xml" (case sensitive).
MAILSIFT_CORE_EXPORT bool is_extracted_member(std::string_view member_name);

/**
 * @brief Extracts the contents of the XML members of a zip archive with libarchive.
 *
 * Each XML member becomes one text block, in the index order of the archive's central directory
 * whatever the order of the member data. Other members are skipped. An archive without members
 * gives no blocks.
 *
 * Throws an error tagged `errors::archive_open` when the buffer is not a readable zip
 * archive, and `errors::member_read` when a member cannot be read or an XML member is not
 * valid UTF-8; in both cases nothing is returned for the members already read.
 */
MAILSIFT_CORE_EXPORT std::vector<text_block> extract(byte_span buffer);

} // namespace mailsift::zip_archive

#endif // MAILSIFT_ZIP_ARCHIVE_EXTRACTOR_H
