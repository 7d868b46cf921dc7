/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <string>
#include <vector>
#include "http_parser.h"
#include "HttpMessageView.hpp"
#include "../../util/cb/EventReporter.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace mitm
		{
			namespace http
			{

				/// <summary>
				/// Splits a complete raw HTTP/1.x response, as captured by the host, into an
				/// HttpMessageView. The status line and every header line are kept exactly as they
				/// appeared on the wire, in wire order. A folded header keeps its continuation
				/// lines. The body is every byte after the header block, except that chunked
				/// payloads come out de-chunked.
				///
				/// One parser may be reused for any number of messages, but not concurrently.
				/// </summary>
				class HttpResponseParser : public util::cb::EventReporter
				{

				public:

					/// <summary>
					/// Initializes the internal http_parser object.
					/// </summary>
					/// <exception cref="std::runtime_error">
					/// If the http_parser could not be allocated.
					/// </exception>
					HttpResponseParser(
						util::cb::MessageFunction onInfo = nullptr,
						util::cb::MessageFunction onWarning = nullptr,
						util::cb::MessageFunction onError = nullptr
						);

					HttpResponseParser(const HttpResponseParser&) = delete;
					HttpResponseParser(HttpResponseParser&&) = delete;
					HttpResponseParser& operator=(const HttpResponseParser&) = delete;

					/// <summary>
					/// Frees the internal http_parser.
					/// </summary>
					~HttpResponseParser();

					/// <summary>
					/// Parses the supplied bytes as one complete response. Any state from a
					/// previous call is discarded first.
					/// </summary>
					/// <param name="data">
					/// A valid pointer to the start of the raw response.
					/// </param>
					/// <param name="length">
					/// The total length in bytes of the raw response.
					/// </param>
					/// <returns>
					/// True if a complete response was parsed, false otherwise. Reasons for
					/// failure are given to the error callback.
					/// </returns>
					const bool Parse(const char* data, const size_t length);

					/// <summary>
					/// Gets a view of the last successfully parsed response. Calling this after
					/// a failed Parse(...) gives an empty view.
					/// </summary>
					HttpMessageView GetMessage() const;

				private:

					http_parser* m_httpParser = nullptr;

					http_parser_settings m_httpParserSettings;

					std::string m_statusLine;

					HttpHeaderLines m_headers;

					std::vector<char> m_body;

					/// <summary>
					/// Header names and values may arrive in multiple pieces. The start of the
					/// pending header line and the end of the last piece seen for it are kept
					/// here until the next field begins. Both point into the buffer given to
					/// Parse(...).
					/// </summary>
					const char* m_lastHeaderStart = nullptr;

					const char* m_lastHeaderDataEnd = nullptr;

					const char* m_dataEnd = nullptr;

					bool m_lastCallbackWasValue = false;

					/// <summary>
					/// Set when the payload is not chunked. Such payloads are not handed to
					/// http_parser at all; the body is every byte after the header block.
					/// </summary>
					bool m_takeRawBody = false;

					bool m_messageComplete = false;

					void Reset();

					void FlushHeader();

					static HttpResponseParser* FromParser(http_parser* parser);

					static int OnMessageBegin(http_parser* parser);

					static int OnHeaderField(http_parser* parser, const char *at, size_t length);

					static int OnHeaderValue(http_parser* parser, const char *at, size_t length);

					static int OnHeadersComplete(http_parser* parser);

					static int OnBody(http_parser* parser, const char *at, size_t length);

					static int OnMessageComplete(http_parser* parser);

				};

			} /* namespace http */
		} /* namespace mitm */
	} /* namespace repairengine */
} /* namespace rr */
