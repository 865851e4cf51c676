/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_JSON_SERIALIZATION_H
#define MAILSIFT_JSON_SERIALIZATION_H

#include "core_export.h"
#include "serialization_base.h"

namespace mailsift::serialization
{

/**
 * @brief Renders a serialized value as compact JSON text.
 *
 * Used by the JSON log sink and to stringify non-textual error context.
 */
MAILSIFT_CORE_EXPORT std::string to_json(const value& s_val);

} // namespace mailsift::serialization

#endif // MAILSIFT_JSON_SERIALIZATION_H
