/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "diagnostic_message.h"

#include "error.h"

namespace mailsift::errors
{

namespace
{

std::string quote(const std::string& s)
{
	return "\"" + s + "\"";
}

std::string location_lines(const source_location& location)
{
	return "in " + std::string{location.function_name()} + "\n" +
		"at " + std::string{location.file_name()} + ":" + std::to_string(location.line()) + "\n";
}

} // anonymous namespace

std::string diagnostic_message(const std::exception& e)
{
	std::string message;
	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception& nested_ex)
	{
		message = diagnostic_message(nested_ex);
	}
	catch (...)
	{
		message = "Unknown error\n";
	}

	const auto* error = dynamic_cast<const errors::base*>(&e);
	if (!error)
	{
		message += "Error: " + quote(e.what()) + "\n";
		message += "No location information available\n";
		return message;
	}
	size_t first_context = 0;
	if (message.empty())
	{
		message += "Error: " + (error->context_count() > 0 ? quote(error->context_string(0)) : quote(e.what())) + "\n";
		first_context = 1;
	}
	else
		message += "wrapped by error\n";
	message += location_lines(error->location);
	for (size_t i = first_context; i < error->context_count(); ++i)
		message += "with context " + quote(error->context_string(i)) + "\n";
	return message;
}

std::string diagnostic_message(std::exception_ptr eptr)
{
	try
	{
		std::rethrow_exception(eptr);
	}
	catch (const std::exception& e)
	{
		return diagnostic_message(e);
	}
	catch (...)
	{
		return "Unknown error\n";
	}
}

} // namespace mailsift::errors
