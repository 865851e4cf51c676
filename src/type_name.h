/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_TYPE_NAME_H
#define MAILSIFT_TYPE_NAME_H

#include "core_export.h"
#include <string>

namespace mailsift::type_name
{

/**
 * @brief Normalizes a compiler supplied function signature (e.g. from source_location) for logs.
 *
 * Removes calling conventions, class/struct/enum keywords and inline namespaces of the
 * standard library so that the same function reads the same with every compiler.
 */
MAILSIFT_CORE_EXPORT std::string pretty_function(const std::string& function_name);

} // namespace mailsift::type_name

#endif // MAILSIFT_TYPE_NAME_H
