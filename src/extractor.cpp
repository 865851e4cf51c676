/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "extractor.h"

#include "error_tags.h"
#include "log_entry.h"
#include "make_error.h"
#include "pdf_extractor.h"
#include "plain_text_extractor.h"
#include "serialization_enum.h" // IWYU pragma: keep
#include "zip_archive_extractor.h"

namespace mailsift
{

std::vector<text_block> extract(format_tag tag, byte_span buffer)
{
	log_entry(tag, buffer.size());
	switch (tag)
	{
		case format_tag::plain_text:
			return plain_text::extract(buffer);
		case format_tag::pdf:
			return pdf::extract(buffer);
		case format_tag::zip_archive:
			return zip_archive::extract(buffer);
		case format_tag::unsupported:
			throw make_error("Text cannot be extracted from this format", errors::unsupported_format{});
	}
	throw make_error("Unknown format tag", static_cast<int>(tag));
}

} // namespace mailsift
