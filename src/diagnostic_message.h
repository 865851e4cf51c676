/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_DIAGNOSTIC_MESSAGE_H
#define MAILSIFT_DIAGNOSTIC_MESSAGE_H

#include "core_export.h"
#include <exception>
#include <string>

namespace mailsift::errors
{

/**
 * @brief Renders an error and the chain of errors nested in it, innermost first, with locations and context.
 */
MAILSIFT_CORE_EXPORT std::string diagnostic_message(const std::exception& e);

MAILSIFT_CORE_EXPORT std::string diagnostic_message(std::exception_ptr eptr);

} // namespace mailsift::errors

#endif // MAILSIFT_DIAGNOSTIC_MESSAGE_H
