/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_CONFIG_H
#define MAILSIFT_CONFIG_H

#include "core_export.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mailsift
{

/**
 * @brief Settings of the mailsift program.
 *
 * Each option can be given on the command line or through an environment variable; the
 * command line wins.
 */
struct config
{
	std::filesystem::path input;
	/// MAILSIFT_OUTPUT
	std::filesystem::path output = "emails.txt";
	/// MAILSIFT_LOG_FILTER, see log::set_filter
	std::string log_filter = "audit";
	/// MAILSIFT_MAX_INPUT_SIZE, 0 for no limit
	std::uint64_t max_input_size = 0;
};

/// @brief Usage and option descriptions for --help and usage errors.
MAILSIFT_CORE_EXPORT std::string usage();

/**
 * @brief Reads the configuration from the command line and the environment.
 *
 * Returns nothing when help was requested.
 * @throw errors::base tagged `errors::invalid_argument` if an option is unknown or has an
 * invalid value, or the input path is missing.
 */
MAILSIFT_CORE_EXPORT std::optional<config> parse_config(int argc, const char* const argv[]);

} // namespace mailsift

#endif // MAILSIFT_CONFIG_H
