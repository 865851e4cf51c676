/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_THROW_IF_H
#define MAILSIFT_THROW_IF_H

#include "make_error.h"

/**
 * @brief Throws an error built from the condition text and the context items when the condition holds.
 *
 * @code
 * throw_if(descriptor == (iconv_t)(-1), "iconv_open() failed", from, to);
 * @endcode
 */
#define MAILSIFT_THROW_IF_AT_LOCATION(condition, location, ...) \
	do { \
		if (condition) \
			throw MAILSIFT_MAKE_ERROR_AT_LOCATION(location, #condition __VA_OPT__(,) __VA_ARGS__); \
	} while (false)

#define MAILSIFT_THROW_IF(condition, ...) \
	MAILSIFT_THROW_IF_AT_LOCATION(condition, mailsift::source_location::current() __VA_OPT__(,) __VA_ARGS__)

#ifdef MAILSIFT_ENABLE_SHORT_MACRO_NAMES
#define throw_if MAILSIFT_THROW_IF
#endif

#endif // MAILSIFT_THROW_IF_H
