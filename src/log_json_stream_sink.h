/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_LOG_JSON_STREAM_SINK_H
#define MAILSIFT_LOG_JSON_STREAM_SINK_H

#include "core_export.h"
#include <functional>
#include "log_core.h"
#include <ostream>

namespace mailsift::log
{

/**
 * @brief Sink writing every record as an element of a JSON array to the stream.
 *
 * The array is opened by the first record and closed when the last copy of the returned
 * function is destroyed. The stream must outlive the sink.
 */
MAILSIFT_CORE_EXPORT std::function<void(const record&)> json_stream_sink(std::ostream& stream);

} // namespace mailsift::log

#endif // MAILSIFT_LOG_JSON_STREAM_SINK_H
