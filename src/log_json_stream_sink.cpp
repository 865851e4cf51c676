/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "log_json_stream_sink.h"

#include "json_serialization.h"
#include <memory>
#include <mutex>

namespace mailsift::log
{

std::function<void(const record&)> json_stream_sink(std::ostream& stream)
{
	struct stream_state
	{
		std::ostream& m_stream;
		bool m_first_log = true;
		std::mutex m_mutex;

		explicit stream_state(std::ostream& s) : m_stream(s) {}
		~stream_state()
		{
			if (!m_first_log)
				m_stream << std::endl << "]" << std::endl;
		}
	};

	auto state = std::make_shared<stream_state>(stream);

	return [state](const record& rec)
	{
		serialization::object log_record_object = create_base_metadata(rec.m_location);
		log_record_object.v["log"] = rec.m_context;
		std::string json_output = serialization::to_json(log_record_object);

		std::lock_guard lock(state->m_mutex);
		state->m_stream << (state->m_first_log ? "[" : ",") << std::endl << json_output;
		state->m_first_log = false;
	};
}

} // namespace mailsift::log
