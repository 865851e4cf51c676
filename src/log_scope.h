/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_LOG_SCOPE_H
#define MAILSIFT_LOG_SCOPE_H

#include "log_entry.h"
#include <optional> // IWYU pragma: keep

namespace mailsift::log::detail
{

/// @brief Logs the captured items on construction and again on destruction.
template <typename... Args>
class scope
{
public:
	scope(source_location location, std::tuple<Args...>&& args_tuple)
		: m_location(location), m_args_tuple(std::move(args_tuple))
	{
		log::entry(m_location, std::tuple_cat(std::make_tuple(log::scope_enter{}), m_args_tuple));
	}

	~scope() noexcept
	{
		try
		{
			log::entry(m_location, std::tuple_cat(std::make_tuple(log::scope_exit{}), m_args_tuple));
		}
		catch (const std::exception&)
		{
		}
	}

	scope(const scope&) = delete;
	scope& operator=(const scope&) = delete;

private:
	source_location m_location;
	std::tuple<Args...> m_args_tuple;
};

} // namespace mailsift::log::detail

#define MAILSIFT_LOG_SCOPE_OBJECT_NAME(line) MAILSIFT_LOG_SCOPE_OBJECT_NAME_IMPL(line)
#define MAILSIFT_LOG_SCOPE_OBJECT_NAME_IMPL(line) mailsift_log_scope_object_at_line_##line

// Scope logging is debug only.
#ifdef NDEBUG
	#define MAILSIFT_LOG_SCOPE(...) static_cast<void>(0)
#else
	#define MAILSIFT_LOG_SCOPE(...) \
		[[maybe_unused]] auto MAILSIFT_LOG_SCOPE_OBJECT_NAME(__LINE__) = \
			[&](const auto& loc) { \
				using scope_type = mailsift::log::detail::scope<MAILSIFT_DIAGNOSTIC_CONTEXT_GET_TYPES(__VA_ARGS__)>; \
				if (mailsift::log::detail::is_logging_enabled()) \
					return std::optional<scope_type>(std::in_place, loc, std::make_tuple(MAILSIFT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
				return std::optional<scope_type>{}; \
			}(mailsift::source_location::current())
#endif

#ifdef MAILSIFT_ENABLE_SHORT_MACRO_NAMES
	#define log_scope(...) MAILSIFT_LOG_SCOPE(__VA_ARGS__)
#endif

#endif // MAILSIFT_LOG_SCOPE_H
