/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "json_serialization.h"

#include <boost/json.hpp>

namespace mailsift::serialization
{

namespace
{

struct json_converter
{
	boost::json::value operator()(const object& obj) const
	{
		boost::json::object result;
		for (const auto& [key, val] : obj.v)
			result[key] = std::visit(*this, val);
		return result;
	}

	boost::json::value operator()(const array& arr) const
	{
		boost::json::array result;
		result.reserve(arr.v.size());
		for (const auto& val : arr.v)
			result.push_back(std::visit(*this, val));
		return result;
	}

	template <typename T>
	boost::json::value operator()(const T& primitive) const
	{
		return boost::json::value_from(primitive);
	}
};

} // anonymous namespace

std::string to_json(const value& s_val)
{
	return boost::json::serialize(std::visit(json_converter{}, s_val));
}

} // namespace mailsift::serialization
