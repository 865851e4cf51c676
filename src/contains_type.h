/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_CONTAINS_TYPE_H
#define MAILSIFT_CONTAINS_TYPE_H

#include "error.h"
#include <exception>

namespace mailsift::errors
{

/**
 * @brief Checks whether an error, or any error nested in it, has a context item of type T.
 *
 * @code
 * catch (const std::exception& e) {
 *     if (errors::contains_type<errors::pdf_decode>(e))
 *         ...
 * }
 * @endcode
 */
template <typename T>
bool contains_type(const std::exception& e)
{
	if (const auto* error = dynamic_cast<const errors::base*>(&e))
	{
		for (size_t i = 0; i < error->context_count(); ++i)
		{
			if (error->context_type(i) == typeid(T))
				return true;
		}
	}
	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception& nested_ex)
	{
		return contains_type<T>(nested_ex);
	}
	catch (...)
	{
		return false;
	}
	return false;
}

} // namespace mailsift::errors

#endif // MAILSIFT_CONTAINS_TYPE_H
