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

#include <boost/program_options.hpp>
#include <charconv>
#include "environment.h"
#include "error_tags.h"
#include <exception>
#include "log_entry.h"
#include "make_error.h"
#include "serialization_filesystem.h" // IWYU pragma: keep
#include <sstream>
#include <string_view>

namespace po = boost::program_options;

namespace mailsift
{

namespace
{

constexpr std::string_view output_variable = "MAILSIFT_OUTPUT";
constexpr std::string_view log_filter_variable = "MAILSIFT_LOG_FILTER";
constexpr std::string_view max_input_size_variable = "MAILSIFT_MAX_INPUT_SIZE";

po::options_description visible_options()
{
	po::options_description options{"Options"};
	options.add_options()
		("help,h", "print this help and exit")
		("output,o", po::value<std::string>(), "file the addresses are written to (MAILSIFT_OUTPUT, default: emails.txt)")
		("log-filter", po::value<std::string>(), "log filter: tags, @file:<pattern> or @func:<pattern>, '-' to deny, '*' for all (MAILSIFT_LOG_FILTER, default: audit)")
		("max-input-size", po::value<std::string>(), "largest input file in bytes, 0 for no limit (MAILSIFT_MAX_INPUT_SIZE, default: 0)");
	return options;
}

std::uint64_t parse_size(const std::string& size_string, std::string_view source)
{
	std::uint64_t size = 0;
	const char* end = size_string.data() + size_string.size();
	auto [parsed_end, error] = std::from_chars(size_string.data(), end, size);
	if (error != std::errc{} || parsed_end != end)
		throw make_error("Invalid input size limit", size_string, source, errors::invalid_argument{});
	return size;
}

std::optional<std::string> option_value(const po::variables_map& variables, const std::string& name, std::string_view environment_variable)
{
	if (variables.count(name))
		return variables[name].as<std::string>();
	return environment::get(environment_variable);
}

} // anonymous namespace

std::string usage()
{
	std::ostringstream stream;
	stream << "Usage: mailsift [options] <path>\n"
		<< "Finds email addresses in the document at <path>.\n\n"
		<< visible_options();
	return stream.str();
}

std::optional<config> parse_config(int argc, const char* const argv[])
{
	po::options_description hidden;
	hidden.add_options()("input", po::value<std::string>());
	po::options_description all_options;
	all_options.add(visible_options()).add(hidden);
	po::positional_options_description positional;
	positional.add("input", 1);

	po::variables_map variables;
	try
	{
		po::store(po::command_line_parser(argc, argv).options(all_options).positional(positional).run(), variables);
		po::notify(variables);
	}
	catch (const po::error&)
	{
		std::throw_with_nested(make_error("Invalid command line", errors::invalid_argument{}));
	}

	if (variables.count("help"))
		return std::nullopt;

	config result;
	if (!variables.count("input"))
		throw make_error("Input file path is missing", errors::invalid_argument{});
	result.input = variables["input"].as<std::string>();
	if (std::optional<std::string> output = option_value(variables, "output", output_variable))
	{
		if (output->empty())
			throw make_error("Output file path is empty", errors::invalid_argument{});
		result.output = *output;
	}
	if (std::optional<std::string> log_filter = option_value(variables, "log-filter", log_filter_variable))
		result.log_filter = *log_filter;
	if (variables.count("max-input-size"))
		result.max_input_size = parse_size(variables["max-input-size"].as<std::string>(), "--max-input-size");
	else if (std::optional<std::string> max_input_size = environment::get(max_input_size_variable))
		result.max_input_size = parse_size(*max_input_size, max_input_size_variable);
	log_entry(result.input, result.output, result.log_filter, result.max_input_size);
	return result;
}

} // namespace mailsift
