/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_SERIALIZATION_ENUM_H
#define MAILSIFT_SERIALIZATION_ENUM_H

#include "serialization_base.h"
#include <magic_enum/magic_enum.hpp>

namespace mailsift::serialization
{

template <typename T> requires std::is_enum_v<T>
struct serializer<T>
{
	value full(const T& value) const { return std::string{magic_enum::enum_name(value)}; }
};

} // namespace mailsift::serialization

#endif // MAILSIFT_SERIALIZATION_ENUM_H
