/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_LOG_ENTRY_H
#define MAILSIFT_LOG_ENTRY_H

#include "diagnostic_context.h"
#include "log_core.h"
#include "log_tags.h"
#include "serialization_base.h"
#include "source_location.h"
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace mailsift::log
{

namespace detail
{

template <typename T>
serialization::value serialize_item(const T& item)
{
	if constexpr (context_tag<T>)
		return serialization::object{{{"tag", std::string{T::string()}}}};
	else
		return serialization::full(item);
}

template <typename T>
serialization::value serialize_item(const std::pair<std::string, T>& item)
{
	return serialization::object{{{item.first, serialization::full(item.second)}}};
}

template <typename T>
void append_tag(std::vector<std::string_view>& tags)
{
	if constexpr (context_tag<T>)
		tags.push_back(T::string());
}

template <typename... Args>
constexpr bool should_log_in_release()
{
	return (std::is_same_v<std::remove_cvref_t<Args>, audit> || ...);
}

} // namespace detail

/**
 * @brief Serializes the context items and hands them to the sink if the filter accepts the entry.
 *
 * Tags among the items take part in filtering. Use the `log_entry` macro instead of calling
 * this directly so that items are named after the logged expressions.
 */
template <typename... Args>
void entry(source_location location, std::tuple<Args...>&& context)
{
	std::vector<std::string_view> tags;
	(detail::append_tag<Args>(tags), ...);
	if (!detail::is_enabled(location, tags))
		return;
	serialization::array items;
	std::apply([&](const auto&... item) { (items.v.push_back(detail::serialize_item(item)), ...); }, context);
	record rec{location, std::move(items)};
}

} // namespace mailsift::log

#ifdef NDEBUG
	#define MAILSIFT_LOG_ENTRY(...) \
		[&](const auto& loc) { \
			if constexpr (mailsift::log::detail::should_log_in_release<MAILSIFT_DIAGNOSTIC_CONTEXT_GET_TYPES(__VA_ARGS__)>()) { \
				if (mailsift::log::detail::is_logging_enabled()) \
					mailsift::log::entry(loc, std::make_tuple(MAILSIFT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
			} \
		}(mailsift::source_location::current())
#else
	#define MAILSIFT_LOG_ENTRY(...) \
		[&](const auto& loc) { \
			if (mailsift::log::detail::is_logging_enabled()) \
				mailsift::log::entry(loc, std::make_tuple(MAILSIFT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
		}(mailsift::source_location::current())
#endif

#ifdef MAILSIFT_ENABLE_SHORT_MACRO_NAMES
	#define log_entry(...) MAILSIFT_LOG_ENTRY(__VA_ARGS__)
#endif

#endif // MAILSIFT_LOG_ENTRY_H
