/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "log_core.h"

#include <algorithm>
#include <atomic>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/c_local_time_adjustor.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include "serialization_filesystem.h" // IWYU pragma: keep
#include "serialization_thread_id.h" // IWYU pragma: keep
#include <sstream>
#include "type_name.h"
#include <vector>

namespace mailsift::log
{

namespace
{

struct filter_rule
{
	enum { TAG, FILE, FUNC } type;
	std::string value;
	bool is_negative;
};

struct filter_spec
{
	std::vector<filter_rule> rules;
	bool wildcard_enabled = false;
};

filter_spec parse_log_filter(const std::string& filter_str)
{
	filter_spec filter;
	std::vector<std::string> rules_str;
	boost::split(rules_str, filter_str, boost::is_any_of(",; "));
	for (auto& rule_str : rules_str)
	{
		boost::trim(rule_str);
		if (rule_str.empty())
			continue;
		if (rule_str == "*")
		{
			filter.wildcard_enabled = true;
			continue;
		}
		filter_rule rule;
		rule.is_negative = rule_str.front() == '-';
		std::string_view rule_view = rule_str;
		if (rule.is_negative)
			rule_view.remove_prefix(1);
		if (rule_view.starts_with("@file:"))
		{
			rule.type = filter_rule::FILE;
			rule_view.remove_prefix(6);
		}
		else if (rule_view.starts_with("@func:"))
		{
			rule.type = filter_rule::FUNC;
			rule_view.remove_prefix(6);
		}
		else
			rule.type = filter_rule::TAG;
		rule.value = std::string{rule_view};
		filter.rules.push_back(std::move(rule));
	}
	return filter;
}

bool wildcard_match(std::string_view pattern, std::string_view text)
{
	if (pattern == "*")
		return true;
	size_t p = 0, t = 0;
	size_t star = std::string_view::npos, star_text = 0;
	while (t < text.size())
	{
		if (p < pattern.size() && pattern[p] == '*')
		{
			star = p++;
			star_text = t;
		}
		else if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t]))
		{
			++p;
			++t;
		}
		else if (star != std::string_view::npos)
		{
			p = star + 1;
			t = ++star_text;
		}
		else
			return false;
	}
	while (p < pattern.size() && pattern[p] == '*')
		++p;
	return p == pattern.size();
}

bool rule_matches(const filter_rule& rule, std::string_view filename, std::string_view funcname, std::span<const std::string_view> tags)
{
	switch (rule.type)
	{
		case filter_rule::FILE:
			return wildcard_match(rule.value, filename);
		case filter_rule::FUNC:
			return wildcard_match(rule.value, funcname);
		case filter_rule::TAG:
			return std::any_of(tags.begin(), tags.end(), [&](std::string_view tag) { return wildcard_match(rule.value, tag); });
	}
	return false;
}

std::mutex g_log_filter_mutex;
filter_spec g_log_filter;
std::string g_log_filter_str;

std::atomic<bool> g_logging_enabled{false};
std::function<void(const record&)> g_log_callback;
std::mutex g_log_callback_mutex;

void write_log_record(const record& rec)
{
	std::lock_guard lock(g_log_callback_mutex);
	if (g_log_callback)
		g_log_callback(rec);
}

} // anonymous namespace

void set_filter(const std::string& filter_spec)
{
	std::lock_guard lock(g_log_filter_mutex);
	g_log_filter = parse_log_filter(filter_spec);
	g_log_filter_str = filter_spec;
}

std::string get_filter()
{
	std::lock_guard lock(g_log_filter_mutex);
	return g_log_filter_str;
}

bool detail::is_enabled(const source_location& location, std::span<const std::string_view> tags)
{
	std::string filename = std::filesystem::path(location.file_name()).filename().string();
	std::string funcname = type_name::pretty_function(location.function_name());

	std::lock_guard lock(g_log_filter_mutex);
	// A matching deny rule wins over any allow rule.
	for (const auto& rule : g_log_filter.rules)
	{
		if (rule.is_negative && rule_matches(rule, filename, funcname, tags))
			return false;
	}
	if (g_log_filter.wildcard_enabled)
		return true;
	return std::any_of(g_log_filter.rules.begin(), g_log_filter.rules.end(), [&](const filter_rule& rule)
	{
		return !rule.is_negative && rule_matches(rule, filename, funcname, tags);
	});
}

void set_sink(std::function<void(const record&)> callback)
{
	std::lock_guard lock(g_log_callback_mutex);
	g_log_callback = std::move(callback);
	g_logging_enabled.store(static_cast<bool>(g_log_callback), std::memory_order_release);
}

std::function<void(const record&)> get_sink()
{
	std::lock_guard lock(g_log_callback_mutex);
	return g_log_callback;
}

bool detail::is_logging_enabled()
{
	return g_logging_enabled.load(std::memory_order_acquire);
}

serialization::object create_base_metadata(source_location location)
{
	boost::posix_time::ptime utc_time = boost::posix_time::second_clock::universal_time();
	boost::date_time::c_local_adjustor<boost::posix_time::ptime> local_adjustor;
	boost::posix_time::ptime local_time = local_adjustor.utc_to_local(utc_time);
	long offset_minutes = (local_time - utc_time).total_seconds() / 60;
	std::ostringstream time_stream;
	time_stream << boost::posix_time::to_iso_extended_string(local_time) << std::setw(5) << std::setfill('0')
		<< std::internal << std::showpos << (offset_minutes / 60) * 100 + offset_minutes % 60;

	serialization::object metadata;
	metadata.v = {
		{"timestamp", time_stream.str()},
		{"file", serialization::full(std::filesystem::path(location.file_name()).filename())},
		{"line", static_cast<std::int64_t>(location.line())},
		{"function", type_name::pretty_function(location.function_name())},
		{"thread_id", serialization::full(std::this_thread::get_id())}
	};
	return metadata;
}

record::record(source_location location, serialization::array&& context)
	: m_location(location), m_context(std::move(context))
{}

record::~record()
{
	try
	{
		write_log_record(*this);
	}
	catch (const std::exception&)
	{
		// Exceptions must not escape a destructor.
	}
}

} // namespace mailsift::log
