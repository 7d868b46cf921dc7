/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <utility>
#include <algorithm>
#include "HttpMessageView.hpp"
#include "../../../util/string/StringRefUtil.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace mitm
		{
			namespace http
			{

				HttpMessageView::HttpMessageView()
				{

				}

				HttpMessageView::HttpMessageView(std::string statusLine, HttpHeaderLines headers, std::vector<char> body)
					:
					m_statusLine(std::move(statusLine)),
					m_headers(std::move(headers)),
					m_body(std::move(body))
				{

				}

				const std::string& HttpMessageView::GetStatusLine() const
				{
					return m_statusLine;
				}

				const HttpHeaderLines& HttpMessageView::GetHeaders() const
				{
					return m_headers;
				}

				const std::vector<char>& HttpMessageView::GetBody() const
				{
					return m_body;
				}

				const bool HttpMessageView::HasHeader(const std::string& name) const
				{
					return std::any_of(m_headers.begin(), m_headers.end(), [&name](const std::string& line)
					{
						return rr::util::string::IsHeaderNamed(line, name);
					});
				}

				bool HttpMessageView::operator==(const HttpMessageView& other) const
				{
					return m_statusLine == other.m_statusLine &&
						m_headers == other.m_headers &&
						m_body == other.m_body;
				}

				bool HttpMessageView::operator!=(const HttpMessageView& other) const
				{
					return !(*this == other);
				}

			} /* namespace http */
		} /* namespace mitm */
	} /* namespace repairengine */
} /* namespace rr */
