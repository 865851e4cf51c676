/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_DOCUMENT_H
#define MAILSIFT_DOCUMENT_H

#include "content_type.h"
#include "core_export.h"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace mailsift
{

struct limits
{
	/// @brief Largest input file accepted, in bytes. 0 accepts any size.
	std::uint64_t max_input_size = 0;
};

/// @brief A file read from disk, with its detected content type and extracted text.
struct document
{
	std::filesystem::path path;
	std::uint64_t size;
	content_type::signature_match signature;
	std::vector<text_block> text;
};

/**
 * @brief Reads the whole file into memory, detects its content type and extracts its text.
 *
 * @throw errors::base tagged `errors::file_not_found` if the path does not exist,
 * `errors::input_too_large` if the file exceeds `limits::max_input_size` and
 * `errors::file_read` if it cannot be read, or any error of `mailsift::extract`.
 */
MAILSIFT_CORE_EXPORT document load_document(const std::filesystem::path& path, const limits& limits = {});

} // namespace mailsift

#endif // MAILSIFT_DOCUMENT_H
