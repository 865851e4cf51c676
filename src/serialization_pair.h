/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_SERIALIZATION_PAIR_H
#define MAILSIFT_SERIALIZATION_PAIR_H

#include "serialization_base.h"
#include <utility>

namespace mailsift::serialization
{

template <typename T1, typename T2>
struct serializer<std::pair<T1, T2>>
{
	value full(const std::pair<T1, T2>& pair) const
	{
		return object{{
			{"first", serialization::full(pair.first)},
			{"second", serialization::full(pair.second)}
		}};
	}
};

} // namespace mailsift::serialization

#endif // MAILSIFT_SERIALIZATION_PAIR_H
