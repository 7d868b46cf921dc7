/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <string>
#include <vector>
#include "HttpMessageView.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace mitm
		{
			namespace http
			{

				/// <summary>
				/// Formats the status line and header lines into a complete header block,
				/// including the terminating empty line.
				/// </summary>
				/// <param name="statusLine">
				/// The status line, without CRLF.
				/// </param>
				/// <param name="headers">
				/// The header lines, without CRLFs, written in the given order.
				/// </param>
				/// <returns>
				/// std::string populated with the complete, formatted header block.
				/// </returns>
				std::string HeadersToString(const std::string& statusLine, const HttpHeaderLines& headers);

				/// <summary>
				/// Builds a complete raw response that the host can substitute for the one it
				/// captured.
				///
				/// The body handed in is always a plain, fixed length body, so any chunked
				/// Transfer-Encoding declaration is dropped. When updateContentLength is true,
				/// every Content-Length header is removed and a single one carrying the real
				/// body length is written in place of the first, or appended if there was none.
				/// When it is false, existing Content-Length headers are left alone, but a
				/// message that lost its chunked framing and has no Content-Length still gets
				/// one, so the result is always framed.
				/// </summary>
				/// <param name="statusLine">
				/// The status line, without CRLF.
				/// </param>
				/// <param name="headers">
				/// The header lines, without CRLFs.
				/// </param>
				/// <param name="body">
				/// The raw body bytes.
				/// </param>
				/// <param name="updateContentLength">
				/// Whether to make the Content-Length header agree with the body.
				/// </param>
				/// <returns>
				/// The complete message bytes.
				/// </returns>
				std::vector<char> BuildHttpMessage(
					const std::string& statusLine,
					const HttpHeaderLines& headers,
					const std::vector<char>& body,
					const bool updateContentLength = true
					);

			} /* namespace http */
		} /* namespace mitm */
	} /* namespace repairengine */
} /* namespace rr */
