/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_LOG_CORE_H
#define MAILSIFT_LOG_CORE_H

#include "core_export.h"
#include "serialization_base.h"
#include "source_location.h"
#include <functional>
#include <span>
#include <string>
#include <string_view>

/**
 * @brief Structured logging.
 *
 * Log entries are arrays of serialized context items (see `log_entry` and `log_scope`).
 * Nothing is logged until a sink is installed with `set_sink`, and only entries accepted
 * by the filter set with `set_filter` reach it. In release builds only entries tagged
 * `log::audit` are compiled in.
 *
 * Filter syntax: rules separated by commas, semicolons or spaces. A rule is a tag name,
 * `@file:<pattern>` or `@func:<pattern>`, with `*` and `?` wildcards; a leading `-` denies
 * instead of allowing, and a lone `*` allows everything not denied.
 */
namespace mailsift::log
{

class MAILSIFT_CORE_EXPORT record
{
public:
	record(source_location location, serialization::array&& context);
	~record();

	record(const record&) = delete;
	record& operator=(const record&) = delete;

	source_location m_location;
	serialization::array m_context;
};

MAILSIFT_CORE_EXPORT void set_filter(const std::string& filter_spec);

MAILSIFT_CORE_EXPORT std::string get_filter();

/**
 * @brief Installs the function receiving every enabled record. An empty function disables logging.
 * @see json_stream_sink
 */
MAILSIFT_CORE_EXPORT void set_sink(std::function<void(const record&)> callback);

MAILSIFT_CORE_EXPORT std::function<void(const record&)> get_sink();

/**
 * @brief Timestamp, file, line, function and thread of a record, for sinks.
 */
MAILSIFT_CORE_EXPORT serialization::object create_base_metadata(source_location location);

namespace detail
{
MAILSIFT_CORE_EXPORT bool is_enabled(const source_location& location, std::span<const std::string_view> entry_tags);
MAILSIFT_CORE_EXPORT bool is_logging_enabled();
}

} // namespace mailsift::log

#endif // MAILSIFT_LOG_CORE_H
