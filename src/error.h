/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_ERROR_H
#define MAILSIFT_ERROR_H

#include "core_export.h"
#include "diagnostic_context.h" // IWYU pragma: keep
#include <exception>
#include "serialization_pair.h" // IWYU pragma: keep
#include "source_location.h"
#include "stringification.h"
#include <tuple>
#include <typeinfo>
#include <utility>

/**
 * @brief Errors carrying their source location and arbitrary context items.
 *
 * Errors are thrown as exceptions, created with the `make_error` macro and wrapped with
 * `std::throw_with_nested` when a lower layer fails. The kind of an error is expressed by
 * a tag among its context items (see error_tags.h) and tested with `errors::contains_type`.
 */
namespace mailsift::errors
{

/**
 * @brief Base class of every error thrown by mailsift.
 *
 * The context items can be any values: messages, name/value pairs produced from captured
 * variables, or tags. `what()` returns the first context item if it is a message and the
 * error type otherwise; use `errors::diagnostic_message` to get the full report.
 *
 * @code
 * try {
 *     auto blocks = mailsift::extract(tag, buffer);
 * } catch (const mailsift::errors::base& e) {
 *     std::cerr << mailsift::errors::diagnostic_message(e) << std::endl;
 * }
 * @endcode
 */
struct MAILSIFT_CORE_EXPORT base : public std::exception
{
	/// @brief Where the error was created.
	source_location location;

	explicit base(const source_location& location = source_location::current());

	/// @brief Type of the context item at the given index.
	virtual std::type_info const& context_type(size_t index) const noexcept = 0;

	/// @brief Human readable form of the context item at the given index.
	virtual std::string context_string(size_t index) const = 0;

	virtual size_t context_count() const noexcept = 0;

	const char* what() const noexcept override;
};

/**
 * @brief Error holding a tuple of context items of arbitrary types.
 *
 * Do not construct directly; `make_error` deduces the types and captures the location.
 */
template <typename... T>
struct impl : public base
{
private:
	template<size_t I>
	std::string context_string_impl() const
	{
		return stringify(std::get<I>(context));
	}

	template<size_t I>
	const std::type_info& context_type_impl() const noexcept
	{
		return typeid(std::get<I>(context));
	}

	template <size_t... Is>
	std::string context_string_at(size_t index, std::index_sequence<Is...>) const
	{
		using func_type = std::string(impl::*)() const;
		static constexpr func_type funcs[] = { &impl::template context_string_impl<Is>... };
		return (this->*funcs[index])();
	}

	template <size_t... Is>
	const std::type_info& context_type_at(size_t index, std::index_sequence<Is...>) const noexcept
	{
		using func_type = const std::type_info&(impl::*)() const noexcept;
		static constexpr func_type funcs[] = { &impl::template context_type_impl<Is>... };
		return (this->*funcs[index])();
	}

public:
	std::tuple<T...> context;

	explicit impl(const std::tuple<T...>& context_tuple, const source_location& location = source_location::current())
		: base(location), context(context_tuple)
	{
	}

	std::type_info const& context_type(size_t index) const noexcept override
	{
		return context_type_at(index, std::make_index_sequence<sizeof...(T)>{});
	}

	std::string context_string(size_t index) const override
	{
		return context_string_at(index, std::make_index_sequence<sizeof...(T)>{});
	}

	size_t context_count() const noexcept override
	{
		return sizeof...(T);
	}

	const char* what() const noexcept override
	{
		if constexpr (sizeof...(T) > 0)
		{
			if constexpr (std::is_same_v<std::tuple_element_t<0, std::tuple<T...>>, const char*>)
				return std::get<0>(context);
		}
		return base::what();
	}
};

} // namespace mailsift::errors

#endif // MAILSIFT_ERROR_H
