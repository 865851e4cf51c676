/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_ZIP_CENTRAL_DIRECTORY_H
#define MAILSIFT_ZIP_CENTRAL_DIRECTORY_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailsift::zip_archive
{

struct central_directory_entry
{
	std::string name;
	std::uint64_t local_header_offset;
};

/**
 * @brief Lists the members of a zip archive as its central directory records them, in index order.
 *
 * Finds the end of central directory record (a zip64 one when the classic record points to it)
 * and walks the file headers it refers to. Returns nothing when the record is missing or the
 * directory does not fit in the data. An archive without members gives an empty list.
 */
std::optional<std::vector<central_directory_entry>> read_central_directory(std::string_view data);

} // namespace mailsift::zip_archive

#endif // MAILSIFT_ZIP_CENTRAL_DIRECTORY_H
