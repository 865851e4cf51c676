/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_STRINGIFICATION_H
#define MAILSIFT_STRINGIFICATION_H

#include "diagnostic_context.h"
#include "json_serialization.h"
#include <string>
#include <type_traits>
#include <utility>

namespace mailsift
{

template <typename T>
std::string stringify(const T& value);

namespace detail
{

template <typename T>
struct is_pair : std::false_type {};

template <typename T1, typename T2>
struct is_pair<std::pair<T1, T2>> : std::true_type {};

} // namespace detail

/**
 * @brief Human readable form of an error or log context item.
 *
 * Tags give their name, strings stay as they are, name/value pairs become "name: value"
 * and everything else is rendered as JSON through the serialization model.
 */
template <typename T>
std::string stringify(const T& value)
{
	if constexpr (context_tag<T>)
		return std::string{T::string()};
	else if constexpr (detail::is_pair<T>::value)
		return stringify(value.first) + ": " + stringify(value.second);
	else if constexpr (std::is_pointer_v<T> && string_like<T>)
		return value ? std::string{value} : std::string{"null"};
	else if constexpr (string_like<T>)
		return std::string{std::string_view{value}};
	else
	{
		serialization::value serialized = serialization::full(value);
		if (const std::string* str = std::get_if<std::string>(&serialized))
			return *str;
		return serialization::to_json(serialized);
	}
}

} // namespace mailsift

#endif // MAILSIFT_STRINGIFICATION_H
