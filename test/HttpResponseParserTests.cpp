/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "TestUtil.hpp"
#include "rr/repairengine/mitm/http/HttpResponseParser.hpp"

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
					const bool ParseString(HttpResponseParser& parser, const std::string& raw)
					{
						return parser.Parse(raw.data(), raw.size());
					}
				}

				TEST(HttpResponseParserTest, ParsesFixedLengthResponse)
				{
					HttpResponseParser parser;

					ASSERT_TRUE(ParseString(parser,
						"HTTP/1.1 302 Found\r\n"
						"Location: /app.js\r\n"
						"Content-Type: application/x-javascript\r\n"
						"Content-Length: 5\r\n"
						"\r\n"
						"hello"));

					auto message = parser.GetMessage();

					EXPECT_EQ("HTTP/1.1 302 Found", message.GetStatusLine());

					HttpHeaderLines expected{
						"Location: /app.js",
						"Content-Type: application/x-javascript",
						"Content-Length: 5"
					};

					EXPECT_EQ(expected, message.GetHeaders());
					EXPECT_EQ("hello", test::ToString(message.GetBody()));
				}

				TEST(HttpResponseParserTest, KeepsDuplicateHeadersInOrder)
				{
					HttpResponseParser parser;

					ASSERT_TRUE(ParseString(parser,
						"HTTP/1.1 200 OK\r\n"
						"Set-Cookie: a=1\r\n"
						"X-Other: x\r\n"
						"Set-Cookie: b=2\r\n"
						"Content-Length: 0\r\n"
						"\r\n"));

					HttpHeaderLines expected{
						"Set-Cookie: a=1",
						"X-Other: x",
						"Set-Cookie: b=2",
						"Content-Length: 0"
					};

					EXPECT_EQ(expected, parser.GetMessage().GetHeaders());
					EXPECT_TRUE(parser.GetMessage().GetBody().empty());
				}

				TEST(HttpResponseParserTest, KeepsHeaderLinesAsTheyArrived)
				{
					HttpResponseParser parser;

					ASSERT_TRUE(ParseString(parser,
						"HTTP/1.1 302 Found\r\n"
						"Location:/app.js\r\n"
						"X-Spaced:   two  spaces  \r\n"
						"X-Empty:\r\n"
						"X-Folded: first\r\n"
						"  second\r\n"
						"Content-Length: 4\r\n"
						"\r\n"
						"body"));

					HttpHeaderLines expected{
						"Location:/app.js",
						"X-Spaced:   two  spaces  ",
						"X-Empty:",
						"X-Folded: first\r\n  second",
						"Content-Length: 4"
					};

					EXPECT_EQ(expected, parser.GetMessage().GetHeaders());
					EXPECT_EQ("body", test::ToString(parser.GetMessage().GetBody()));
				}

				TEST(HttpResponseParserTest, TakesEverythingAfterHeadersAsBody)
				{
					HttpResponseParser parser;

					// Declared length is wrong, the captured bytes win.
					ASSERT_TRUE(ParseString(parser,
						"HTTP/1.1 301 Moved Permanently\r\n"
						"Content-Length: 3\r\n"
						"\r\n"
						"0123456789"));

					EXPECT_EQ("0123456789", test::ToString(parser.GetMessage().GetBody()));
				}

				TEST(HttpResponseParserTest, PreservesBinaryBody)
				{
					HttpResponseParser parser;

					std::vector<char> body{ '\x1f', '\x8b', '\0', '\x08', '\0', '\xff' };

					auto raw = test::MakeRawResponse("HTTP/1.1 200 OK", { "Content-Length: 6" }, body);

					ASSERT_TRUE(parser.Parse(raw.data(), raw.size()));
					EXPECT_EQ(body, parser.GetMessage().GetBody());
				}

				TEST(HttpResponseParserTest, DechunksChunkedBody)
				{
					HttpResponseParser parser;

					ASSERT_TRUE(ParseString(parser,
						"HTTP/1.1 200 OK\r\n"
						"Transfer-Encoding: chunked\r\n"
						"\r\n"
						"5\r\nhello\r\n"
						"6\r\n world\r\n"
						"0\r\n\r\n"));

					auto message = parser.GetMessage();

					EXPECT_EQ("hello world", test::ToString(message.GetBody()));
					EXPECT_TRUE(message.HasHeader("transfer-encoding"));
				}

				TEST(HttpResponseParserTest, FailsOnIncompleteChunkedBody)
				{
					test::MessageCollector errors;
					HttpResponseParser parser(nullptr, nullptr, std::ref(errors));

					EXPECT_FALSE(ParseString(parser,
						"HTTP/1.1 200 OK\r\n"
						"Transfer-Encoding: chunked\r\n"
						"\r\n"
						"a\r\nhel"));

					EXPECT_TRUE(errors.Contains("chunked payload is incomplete"));
				}

				TEST(HttpResponseParserTest, FailsOnUnterminatedHeaders)
				{
					test::MessageCollector errors;
					HttpResponseParser parser(nullptr, nullptr, std::ref(errors));

					EXPECT_FALSE(ParseString(parser, "HTTP/1.1 302 Found\r\nLocation: /a"));
					EXPECT_TRUE(errors.Contains("header block is not terminated"));
				}

				TEST(HttpResponseParserTest, FailsOnGarbage)
				{
					test::MessageCollector errors;
					HttpResponseParser parser(nullptr, nullptr, std::ref(errors));

					EXPECT_FALSE(ParseString(parser, "NOT HTTP AT ALL\r\n\r\n"));
					EXPECT_TRUE(errors.Contains("http_parser error"));
				}

				TEST(HttpResponseParserTest, FailsOnEmptyInput)
				{
					HttpResponseParser parser;

					EXPECT_FALSE(parser.Parse(nullptr, 0));
					EXPECT_FALSE(ParseString(parser, ""));
				}

				TEST(HttpResponseParserTest, ParserIsReusable)
				{
					HttpResponseParser parser;

					ASSERT_TRUE(ParseString(parser, "HTTP/1.1 302 Found\r\nX-A: 1\r\n\r\nfirst"));
					ASSERT_TRUE(ParseString(parser, "HTTP/1.0 200 OK\r\nX-B: 2\r\n\r\nsecond"));

					auto message = parser.GetMessage();

					EXPECT_EQ("HTTP/1.0 200 OK", message.GetStatusLine());
					EXPECT_EQ(HttpHeaderLines{ "X-B: 2" }, message.GetHeaders());
					EXPECT_EQ("second", test::ToString(message.GetBody()));
				}

			} /* namespace http */
		} /* namespace mitm */
	} /* namespace repairengine */
} /* namespace rr */
