/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_EMAIL_SCANNER_H
#define MAILSIFT_EMAIL_SCANNER_H

#include "core_export.h"
#include "text_block.h"
#include <filesystem>
#include <iosfwd>
#include <set>
#include <string>
#include <vector>

namespace mailsift::email
{

/**
 * @brief Finds the email addresses in the text blocks.
 *
 * Matches `local@domain.tld` where the top level domain has at least two letters. Addresses
 * are not validated beyond the pattern. An address must start and end at a word boundary, and
 * letters and digits of any script are word characters: "éa@b.com" holds no address, while
 * "«a@b.com»" does. Duplicates collapse; the set is ordered so the
 * result does not depend on where in the document an address occurs.
 */
MAILSIFT_CORE_EXPORT std::set<std::string> scan(const std::vector<text_block>& blocks);

/// @brief Writes one address per line, each terminated by '\n'.
MAILSIFT_CORE_EXPORT void write(const std::set<std::string>& addresses, std::ostream& stream);

/**
 * @brief Writes the addresses to a file, replacing its contents.
 * @throw errors::base tagged `errors::output_write` if the file cannot be created or written.
 */
MAILSIFT_CORE_EXPORT void write_to_file(const std::set<std::string>& addresses, const std::filesystem::path& path);

} // namespace mailsift::email

#endif // MAILSIFT_EMAIL_SCANNER_H
