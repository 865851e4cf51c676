/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_TEXT_BLOCK_H
#define MAILSIFT_TEXT_BLOCK_H

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace mailsift
{

/// @brief Borrowed, read-only view of a whole file's contents.
using byte_span = std::span<const std::byte>;

inline byte_span as_byte_span(std::string_view data)
{
	return std::as_bytes(std::span{data.data(), data.size()});
}

inline std::string_view as_string_view(byte_span data)
{
	return {reinterpret_cast<const char*>(data.data()), data.size()};
}

/**
 * @brief One unit of extracted UTF-8 text: a line of a text file, the text of a PDF
 * document or the contents of one archive member.
 */
struct text_block
{
	std::string v;
	bool operator==(const text_block&) const = default;
};

} // namespace mailsift

#endif // MAILSIFT_TEXT_BLOCK_H
