/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "type_name.h"

#include <boost/algorithm/string.hpp>

namespace mailsift::type_name
{

namespace
{

std::string normalize_name(const std::string& name)
{
	std::string normalized = name;
	boost::algorithm::erase_all(normalized, "__cdecl ");
	boost::algorithm::erase_all(normalized, "class ");
	boost::algorithm::erase_all(normalized, "struct ");
	boost::algorithm::erase_all(normalized, "enum ");
	boost::algorithm::replace_all(normalized, "::__cxx11", "");
	boost::algorithm::replace_all(normalized, "std::__1::", "std::");
	boost::algorithm::replace_all(normalized, "std::__fs::", "std::");
	boost::algorithm::replace_all(normalized, "(void)", "()");
	boost::algorithm::replace_all(normalized, ", ", ",");
	boost::algorithm::replace_all(normalized, " >", ">");
	return normalized;
}

} // anonymous namespace

std::string pretty_function(const std::string& function_name)
{
	return normalize_name(function_name);
}

} // namespace mailsift::type_name
