/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_CHARSET_CONVERTER_H
#define MAILSIFT_CHARSET_CONVERTER_H

#include "core_export.h"
#include "pimpl.h"
#include <string>
#include <string_view>

namespace mailsift
{

/**
 * @brief Converts text between character sets with iconv.
 *
 * An instance holds one conversion descriptor and is not safe to use from several threads at once.
 */
class MAILSIFT_CORE_EXPORT charset_converter : public with_pimpl<charset_converter>
{
public:
	/**
	 * @param from Source charset name, e.g. "UTF-16LE".
	 * @param to Target charset name, e.g. "UTF-8".
	 */
	charset_converter(const std::string& from, const std::string& to);
	~charset_converter();

	/// @brief Converts the whole input; throws if it contains a sequence invalid in the source charset.
	std::string convert(std::string_view input) const;
};

} // namespace mailsift

#endif // MAILSIFT_CHARSET_CONVERTER_H
