/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_SERIALIZATION_THREAD_ID_H
#define MAILSIFT_SERIALIZATION_THREAD_ID_H

#include "core_export.h"
#include "serialization_base.h"
#include <thread>

namespace mailsift::serialization
{

template <>
struct serializer<std::thread::id>
{
	MAILSIFT_CORE_EXPORT value full(const std::thread::id& id) const;
};

} // namespace mailsift::serialization

#endif // MAILSIFT_SERIALIZATION_THREAD_ID_H
