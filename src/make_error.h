/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_MAKE_ERROR_H
#define MAILSIFT_MAKE_ERROR_H

#include "diagnostic_context.h"
#include "error.h" // IWYU pragma: keep
#include <tuple> // IWYU pragma: keep
#include <type_traits> // IWYU pragma: keep

#define MAILSIFT_MAKE_ERROR_AT_LOCATION(explicit_location, ...) \
	[&](const auto& location) { \
		auto context_tuple = std::make_tuple(MAILSIFT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__)); \
		return std::apply([&](auto&&... args) { \
			return mailsift::errors::impl<std::remove_cvref_t<decltype(args)>...>(context_tuple, location); \
		}, context_tuple); \
	}(explicit_location)

#define MAILSIFT_MAKE_ERROR(...) \
	MAILSIFT_MAKE_ERROR_AT_LOCATION(mailsift::source_location::current() __VA_OPT__(,) __VA_ARGS__)

#ifdef MAILSIFT_ENABLE_SHORT_MACRO_NAMES
#define make_error MAILSIFT_MAKE_ERROR
#endif

#endif // MAILSIFT_MAKE_ERROR_H
