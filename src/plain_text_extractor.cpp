/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "plain_text_extractor.h"

#include "log_entry.h"
#include "log_scope.h"
#include "utf8.h"

namespace mailsift::plain_text
{

std::vector<text_block> extract(byte_span buffer)
{
	log_scope(buffer.size());
	std::vector<std::string> lines = utf8::split_lines(utf8::decode_lossy(as_string_view(buffer)));
	std::vector<text_block> blocks;
	blocks.reserve(lines.size());
	for (std::string& line : lines)
		blocks.push_back(text_block{std::move(line)});
	log_entry(blocks.size());
	return blocks;
}

} // namespace mailsift::plain_text
