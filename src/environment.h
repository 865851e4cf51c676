/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_ENVIRONMENT_H
#define MAILSIFT_ENVIRONMENT_H

#include "core_export.h"
#include <optional>
#include <string>
#include <string_view>

namespace mailsift::environment
{

/// @brief Value of the environment variable, or nothing if it is not set.
MAILSIFT_CORE_EXPORT std::optional<std::string> get(std::string_view name);

} // namespace mailsift::environment

#endif // MAILSIFT_ENVIRONMENT_H
