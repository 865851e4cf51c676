/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_SERIALIZATION_FILESYSTEM_H
#define MAILSIFT_SERIALIZATION_FILESYSTEM_H

#include <filesystem>
#include "serialization_base.h"

namespace mailsift::serialization
{

template <>
struct serializer<std::filesystem::path>
{
	value full(const std::filesystem::path& p) const { return p.string(); }
};

} // namespace mailsift::serialization

#endif // MAILSIFT_SERIALIZATION_FILESYSTEM_H
