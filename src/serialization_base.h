/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_SERIALIZATION_BASE_H
#define MAILSIFT_SERIALIZATION_BASE_H

#include "concepts.h"
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace mailsift
{

/**
 * @brief Converts arbitrary C++ values into a structured, JSON-like representation.
 *
 * Logging and error reporting capture variables through this model. Support for a new type
 * is added by specializing `serialization::serializer` for it; primitives, strings, strong
 * type aliases, pointers and containers are covered here.
 */
namespace serialization
{

struct object;
struct array;

/// @brief Any serialized value: a primitive or a container of other values.
using value = std::variant<
	std::nullptr_t,
	bool,
	std::int64_t,
	std::uint64_t,
	double,
	std::string,
	array,
	object
>;

struct array { std::vector<value> v; };

struct object { std::map<std::string, value> v; };

template <typename T>
struct serializer;

template <typename T>
value full(const T& value) { return serializer<T>{}.full(value); }

template <typename T>
concept value_alternative = variant_alternative<T, value>;

template <value_alternative T>
struct serializer<T>
{
	value full(const T& value) const { return value; }
};

template <typename T> requires(std::is_arithmetic_v<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& value) const
	{
		if constexpr (std::is_integral_v<T> && std::is_signed_v<T>)
			return static_cast<std::int64_t>(value);
		else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>)
			return static_cast<std::uint64_t>(value);
		else
			return static_cast<double>(value);
	}
};

template <typename T> requires string_like<T> && (!value_alternative<T>)
struct serializer<T>
{
	value full(const T& val) const
	{
		if constexpr (std::is_pointer_v<std::decay_t<T>>)
		{
			if (val == nullptr)
				return nullptr;
		}
		return std::string(val);
	}
};

template <typename T> requires strong_type_alias<T> && (!value_alternative<T>)
struct serializer<T>
{
	value full(const T& value) const { return serialization::full(value.v); }
};

template <empty T>
struct serializer<T>
{
	value full(const T&) const { return object{}; }
};

/// @brief Pointers, smart pointers and optionals: null, or the pointee wrapped in an object.
template <typename T>
requires (dereferenceable<T> && !container<T> && !string_like<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& dereferenceable) const
	{
		if (dereferenceable)
			return object{{{"value", serialization::full(*dereferenceable)}}};
		return nullptr;
	}
};

template <typename T> requires (container<T> && !string_like<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& container) const
	{
		array arr;
		for (const auto& item : container)
			arr.v.push_back(serialization::full(item));
		return arr;
	}
};

template<typename... Ts>
struct serializer<std::variant<Ts...>>
{
	value full(const std::variant<Ts...>& variant) const
	{
		return std::visit([](const auto& value) -> serialization::value { return serialization::full(value); }, variant);
	}
};

} // namespace serialization

} // namespace mailsift

#endif // MAILSIFT_SERIALIZATION_BASE_H
