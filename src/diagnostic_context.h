/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_DIAGNOSTIC_CONTEXT_H
#define MAILSIFT_DIAGNOSTIC_CONTEXT_H

#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace mailsift
{

/**
 * @brief An empty marker type that names itself, e.g. an error kind or a log channel.
 *
 * Tags are passed as context items to `make_error` and `log_entry` as they are,
 * without being wrapped in a name/value pair.
 */
template <typename T>
concept context_tag = std::is_empty_v<T> && requires { { T::string() } -> std::convertible_to<std::string_view>; };

namespace diagnostic_context
{

/**
 * @brief Pairs a captured expression with its text.
 *
 * `make_error("Cannot open", path)` produces the item `{"path", path}`.
 */
template<typename T>
auto make_context_item(const char* name, T&& v) -> std::pair<std::string, std::decay_t<T>>
{
	return {name, std::forward<T>(v)};
}

/// @brief Tags are stored unnamed.
template <context_tag T>
T make_context_item(const char*, T&& v)
{
	return std::forward<T>(v);
}

/// @brief String literals are messages and are stored unnamed.
template <size_t N>
const char* make_context_item(const char*, const char (&v)[N])
{
	return v;
}

} // namespace diagnostic_context

#define MAILSIFT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE_ELEM(r, data, i, elem) \
	BOOST_PP_COMMA_IF(i) mailsift::diagnostic_context::make_context_item(BOOST_PP_STRINGIZE(elem), elem)

#define MAILSIFT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(...) \
	__VA_OPT__(BOOST_PP_SEQ_FOR_EACH_I(MAILSIFT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE_ELEM, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))

#define MAILSIFT_DIAGNOSTIC_CONTEXT_GET_TYPE_ELEM(r, data, i, elem) \
	BOOST_PP_COMMA_IF(i) decltype(mailsift::diagnostic_context::make_context_item(BOOST_PP_STRINGIZE(elem), elem))

#define MAILSIFT_DIAGNOSTIC_CONTEXT_GET_TYPES(...) \
	__VA_OPT__(BOOST_PP_SEQ_FOR_EACH_I(MAILSIFT_DIAGNOSTIC_CONTEXT_GET_TYPE_ELEM, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))

} // namespace mailsift

#endif // MAILSIFT_DIAGNOSTIC_CONTEXT_H
