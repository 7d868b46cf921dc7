/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <string>
#include <vector>

namespace rr
{
	namespace repairengine
	{
		namespace mitm
		{
			namespace http
			{

				/// <summary>
				/// Ordered list of raw "Name: value" header lines. Duplicates are legal and order
				/// is significant, which is why this is not a map.
				/// </summary>
				using HttpHeaderLines = std::vector<std::string>;

				/// <summary>
				/// Read-only view of an intercepted HTTP response, already split into its status
				/// line, its raw header lines and its raw body. The view never changes after
				/// construction; anything that wants to alter a response builds a new one.
				/// </summary>
				class HttpMessageView
				{

				public:

					HttpMessageView();

					/// <summary>
					/// Constructs a view over copies of the supplied parts.
					/// </summary>
					/// <param name="statusLine">
					/// The complete status line, such as "HTTP/1.1 302 Found", without the
					/// trailing CRLF.
					/// </param>
					/// <param name="headers">
					/// The raw header lines, in the order they appeared on the wire, without
					/// trailing CRLFs.
					/// </param>
					/// <param name="body">
					/// The raw body bytes. May be binary.
					/// </param>
					HttpMessageView(std::string statusLine, HttpHeaderLines headers, std::vector<char> body);

					const std::string& GetStatusLine() const;

					const HttpHeaderLines& GetHeaders() const;

					const std::vector<char>& GetBody() const;

					/// <summary>
					/// Checks whether any header line is named the supplied name, ignoring case.
					/// </summary>
					const bool HasHeader(const std::string& name) const;

					/// <summary>
					/// Bit for bit comparison of all three parts.
					/// </summary>
					bool operator==(const HttpMessageView& other) const;

					bool operator!=(const HttpMessageView& other) const;

				private:

					std::string m_statusLine;

					HttpHeaderLines m_headers;

					std::vector<char> m_body;

				};

			} /* namespace http */
		} /* namespace mitm */
	} /* namespace repairengine */
} /* namespace rr */
