/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <cstdlib>
#include <stdexcept>
#include <algorithm>
#include <iterator>
#include "HttpResponseParser.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace mitm
		{
			namespace http
			{

				namespace
				{
					/// <summary>
					/// Finds the offset of the first byte following the empty line that ends the
					/// header block. Both CRLF and bare LF line endings are accepted.
					/// </summary>
					size_t FindBodyOffset(const char* data, const size_t length)
					{
						for (size_t i = 0; i + 1 < length; ++i)
						{
							if (data[i] != '\n')
							{
								continue;
							}

							if (data[i + 1] == '\n')
							{
								return i + 2;
							}

							if (i + 2 < length && data[i + 1] == '\r' && data[i + 2] == '\n')
							{
								return i + 3;
							}
						}

						return std::string::npos;
					}
				}

				HttpResponseParser::HttpResponseParser(
					util::cb::MessageFunction onInfo,
					util::cb::MessageFunction onWarning,
					util::cb::MessageFunction onError
					)
					:
					util::cb::EventReporter(onInfo, onWarning, onError)
				{
					http_parser_settings_init(&m_httpParserSettings);

					m_httpParserSettings.on_message_begin = &OnMessageBegin;
					m_httpParserSettings.on_header_field = &OnHeaderField;
					m_httpParserSettings.on_header_value = &OnHeaderValue;
					m_httpParserSettings.on_headers_complete = &OnHeadersComplete;
					m_httpParserSettings.on_body = &OnBody;
					m_httpParserSettings.on_message_complete = &OnMessageComplete;

					m_httpParser = static_cast<http_parser*>(malloc(sizeof(http_parser)));

					if (m_httpParser == nullptr)
					{
						throw std::runtime_error(u8"In HttpResponseParser::HttpResponseParser() - Failed to initialize http_parser.");
					}
				}

				HttpResponseParser::~HttpResponseParser()
				{
					if (m_httpParser != nullptr)
					{
						free(m_httpParser);
					}
				}

				const bool HttpResponseParser::Parse(const char* data, const size_t length)
				{
					Reset();

					if (data == nullptr || length == 0)
					{
						ReportError(u8"In HttpResponseParser::Parse(const char*, const size_t) - There is no data to parse.");
						return false;
					}

					auto bodyOffset = FindBodyOffset(data, length);

					if (bodyOffset == std::string::npos)
					{
						ReportError(u8"In HttpResponseParser::Parse(const char*, const size_t) - The header block is not terminated.");
						return false;
					}

					http_parser_init(m_httpParser, HTTP_RESPONSE);
					m_httpParser->data = this;
					m_dataEnd = data + length;

					http_parser_execute(m_httpParser, &m_httpParserSettings, data, length);

					auto err = HTTP_PARSER_ERRNO(m_httpParser);

					if (err != HPE_OK && err != HPE_PAUSED)
					{
						std::string errMsg(u8"In HttpResponseParser::Parse(const char*, const size_t) - Failed to parse response. Got http_parser error: ");
						errMsg.append(http_errno_description(err));
						ReportError(errMsg);
						Reset();
						return false;
					}

					if (m_httpParser->upgrade == 1)
					{
						ReportError(u8"In HttpResponseParser::Parse(const char*, const size_t) - Upgrade requested. Unsupported.");
						Reset();
						return false;
					}

					if (m_takeRawBody)
					{
						// Paused right after the headers, so the body is simply everything the
						// host captured after the header block. The declared length is not
						// trusted, since the servers we repair get it wrong as often as not.
						m_body.assign(data + bodyOffset, data + length);
						m_messageComplete = true;
					}

					if (!m_messageComplete)
					{
						ReportError(u8"In HttpResponseParser::Parse(const char*, const size_t) - The chunked payload is incomplete.");
						Reset();
						return false;
					}

					auto statusEnd = std::find(data, data + length, '\n');
					m_statusLine.assign(data, statusEnd);

					if (!m_statusLine.empty() && m_statusLine.back() == '\r')
					{
						m_statusLine.pop_back();
					}

					return true;
				}

				HttpMessageView HttpResponseParser::GetMessage() const
				{
					return HttpMessageView(m_statusLine, m_headers, m_body);
				}

				void HttpResponseParser::Reset()
				{
					m_statusLine.clear();
					m_headers.clear();
					m_body.clear();
					m_lastHeaderStart = nullptr;
					m_lastHeaderDataEnd = nullptr;
					m_lastCallbackWasValue = false;
					m_takeRawBody = false;
					m_messageComplete = false;
				}

				void HttpResponseParser::FlushHeader()
				{
					if (m_lastHeaderStart != nullptr && m_lastHeaderDataEnd != nullptr)
					{
						// The line runs to the terminator following the last piece, which takes
						// in whitespace http_parser leaves out of the value.
						auto lineEnd = m_lastHeaderDataEnd;

						while (lineEnd < m_dataEnd && *lineEnd != '\r' && *lineEnd != '\n')
						{
							++lineEnd;
						}

						m_headers.emplace_back(m_lastHeaderStart, lineEnd);
					}

					m_lastHeaderStart = nullptr;
					m_lastHeaderDataEnd = nullptr;
				}

				HttpResponseParser* HttpResponseParser::FromParser(http_parser* parser)
				{
					if (parser == nullptr)
					{
						return nullptr;
					}

					return static_cast<HttpResponseParser*>(parser->data);
				}

				int HttpResponseParser::OnMessageBegin(http_parser* parser)
				{
					auto trans = FromParser(parser);

					if (trans == nullptr)
					{
						return -1;
					}

					trans->Reset();
					return 0;
				}

				int HttpResponseParser::OnHeaderField(http_parser* parser, const char *at, size_t length)
				{
					auto trans = FromParser(parser);

					if (trans == nullptr)
					{
						return -1;
					}

					if (length == 0)
					{
						trans->ReportError(u8"In HttpResponseParser::OnHeaderField() - Length provided for the parsed header field/name is zero.");
						return -1;
					}

					// A field following a value means the previous header is finished.
					if (trans->m_lastCallbackWasValue)
					{
						trans->FlushHeader();
						trans->m_lastCallbackWasValue = false;
					}

					if (trans->m_lastHeaderStart == nullptr)
					{
						trans->m_lastHeaderStart = at;
					}

					trans->m_lastHeaderDataEnd = at + length;
					return 0;
				}

				int HttpResponseParser::OnHeaderValue(http_parser* parser, const char *at, size_t length)
				{
					auto trans = FromParser(parser);

					if (trans == nullptr)
					{
						return -1;
					}

					if (trans->m_lastHeaderStart == nullptr)
					{
						trans->ReportError(u8"In HttpResponseParser::OnHeaderValue() - OnHeaderValue called while no header field was pending.");
						return -1;
					}

					trans->m_lastCallbackWasValue = true;

					// An empty value is reported with zero length at the start of the next line.
					if (length > 0)
					{
						trans->m_lastHeaderDataEnd = at + length;
					}

					return 0;
				}

				int HttpResponseParser::OnHeadersComplete(http_parser* parser)
				{
					auto trans = FromParser(parser);

					if (trans == nullptr)
					{
						return -1;
					}

					trans->FlushHeader();
					trans->m_lastCallbackWasValue = false;

					if ((parser->flags & F_CHUNKED) == 0)
					{
						// Fixed length or read-until-close payloads are taken raw by Parse(...).
						trans->m_takeRawBody = true;
						http_parser_pause(parser, 1);
					}

					return 0;
				}

				int HttpResponseParser::OnBody(http_parser* parser, const char *at, size_t length)
				{
					auto trans = FromParser(parser);

					if (trans == nullptr)
					{
						return -1;
					}

					std::copy(at, at + length, std::back_inserter(trans->m_body));
					return 0;
				}

				int HttpResponseParser::OnMessageComplete(http_parser* parser)
				{
					auto trans = FromParser(parser);

					if (trans == nullptr)
					{
						return -1;
					}

					trans->m_messageComplete = true;

					// Anything after the first message is not ours to parse.
					http_parser_pause(parser, 1);
					return 0;
				}

			} /* namespace http */
		} /* namespace mitm */
	} /* namespace repairengine */
} /* namespace rr */
