/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_CONCEPTS_H
#define MAILSIFT_CONCEPTS_H

#include <concepts>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <variant>

namespace mailsift
{

/// @brief Iterable type whose elements are not of the type itself (excludes e.g. std::filesystem::path).
template<typename T>
concept container = requires(const T& t) {
	{ std::begin(t) } -> std::input_iterator;
	{ std::end(t) } -> std::input_iterator;
	requires !std::is_same_v<std::remove_cvref_t<T>, std::remove_cvref_t<typename std::iterator_traits<decltype(std::begin(t))>::value_type>>;
};

/// @brief Strong type alias wrapping a single public member `v` (mime_type, text_block).
template <typename T>
concept strong_type_alias = requires(T value) { value.v; };

template<typename T>
concept dereferenceable = requires(const T& t) { *t; !t; };

template<typename T>
concept empty = std::is_empty_v<T>;

template<typename T>
concept string_like = std::is_convertible_v<T, std::string_view>;

template <typename T, typename Variant>
struct is_variant_alternative_trait : std::false_type {};

template <typename T, typename... Us>
struct is_variant_alternative_trait<T, std::variant<Us...>> : std::bool_constant<(std::is_same_v<T, Us> || ...)> {};

template <typename T, typename Variant>
concept variant_alternative = is_variant_alternative_trait<T, Variant>::value;

} // namespace mailsift

#endif // MAILSIFT_CONCEPTS_H
