/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "config.h"
#include "diagnostic_message.h"
#include "document.h"
#include "email_scanner.h"
#include <iostream>
#include "log_entry.h"
#include "log_json_stream_sink.h"
#include "serialization_filesystem.h" // IWYU pragma: keep

using namespace mailsift;

namespace
{

int run(const config& settings)
{
	try
	{
		document input = load_document(settings.input, limits{settings.max_input_size});
		std::set<std::string> addresses = email::scan(input.text);
		if (addresses.empty())
		{
			log_entry("No email address found", input.path, log::audit{});
			return 0;
		}
		email::write_to_file(addresses, settings.output);
		log_entry("Email addresses written", settings.output, addresses.size(), log::audit{});
		return 0;
	}
	catch (const std::exception& e)
	{
		std::cerr << errors::diagnostic_message(e) << std::endl;
		return 1;
	}
}

} // anonymous namespace

int main(int argc, char* argv[])
{
	std::optional<config> settings;
	try
	{
		settings = parse_config(argc, argv);
	}
	catch (const std::exception& e)
	{
		std::cerr << errors::diagnostic_message(e) << std::endl << usage();
		return 1;
	}
	if (!settings)
	{
		std::cout << usage();
		return 0;
	}
	log::set_filter(settings->log_filter);
	log::set_sink(log::json_stream_sink(std::clog));
	int exit_code = run(*settings);
	// Closes the JSON array of the sink.
	log::set_sink({});
	return exit_code;
}
