/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "environment.h"

#include <cstdlib>

namespace mailsift::environment
{

std::optional<std::string> get(std::string_view name)
{
	// std::getenv needs a null-terminated name.
	const std::string name_str{name};
	if (const char* value = std::getenv(name_str.c_str()))
		return std::string{value};
	return std::nullopt;
}

} // namespace mailsift::environment
