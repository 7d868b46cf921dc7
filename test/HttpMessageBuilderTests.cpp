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
#include "rr/repairengine/mitm/http/HttpMessageBuilder.hpp"
#include "rr/repairengine/mitm/http/HttpResponseParser.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace mitm
		{
			namespace http
			{

				TEST(HttpMessageBuilderTest, HeadersToStringTerminatesBlock)
				{
					auto head = HeadersToString("HTTP/1.1 200 OK", { "A: 1", "B: 2" });

					EXPECT_EQ("HTTP/1.1 200 OK\r\nA: 1\r\nB: 2\r\n\r\n", head);
				}

				TEST(HttpMessageBuilderTest, UpdatesContentLengthInPlace)
				{
					auto built = BuildHttpMessage(
						"HTTP/1.1 200 OK",
						{ "Content-Type: application/x-javascript", "content-length: 1200", "X-After: 1", "Content-Length: 9" },
						test::ToBytes("var x=1;")
						);

					EXPECT_EQ(
						"HTTP/1.1 200 OK\r\n"
						"Content-Type: application/x-javascript\r\n"
						"Content-Length: 8\r\n"
						"X-After: 1\r\n"
						"\r\n"
						"var x=1;",
						test::ToString(built));
				}

				TEST(HttpMessageBuilderTest, AppendsMissingContentLength)
				{
					auto built = BuildHttpMessage("HTTP/1.1 200 OK", { "X-A: 1" }, test::ToBytes("abc"));

					EXPECT_EQ("HTTP/1.1 200 OK\r\nX-A: 1\r\nContent-Length: 3\r\n\r\nabc", test::ToString(built));
				}

				TEST(HttpMessageBuilderTest, LeavesContentLengthWhenNotUpdating)
				{
					auto built = BuildHttpMessage("HTTP/1.1 200 OK", { "Content-Length: 1200" }, test::ToBytes("abc"), false);

					EXPECT_EQ("HTTP/1.1 200 OK\r\nContent-Length: 1200\r\n\r\nabc", test::ToString(built));
				}

				TEST(HttpMessageBuilderTest, DropsChunkedTransferEncoding)
				{
					auto built = BuildHttpMessage(
						"HTTP/1.1 200 OK",
						{ "Transfer-Encoding: chunked", "X-A: 1" },
						test::ToBytes("hello world")
						);

					EXPECT_EQ("HTTP/1.1 200 OK\r\nX-A: 1\r\nContent-Length: 11\r\n\r\nhello world", test::ToString(built));
				}

				TEST(HttpMessageBuilderTest, DechunkedBodyStaysFramedWhenNotUpdating)
				{
					auto built = BuildHttpMessage(
						"HTTP/1.1 200 OK",
						{ "Transfer-Encoding: chunked", "X-A: 1" },
						test::ToBytes("hello world"),
						false
						);

					EXPECT_EQ("HTTP/1.1 200 OK\r\nX-A: 1\r\nContent-Length: 11\r\n\r\nhello world", test::ToString(built));
				}

				TEST(HttpMessageBuilderTest, KeepsExistingLengthOfDechunkedBodyWhenNotUpdating)
				{
					auto built = BuildHttpMessage(
						"HTTP/1.1 200 OK",
						{ "Content-Length: 99", "Transfer-Encoding: chunked" },
						test::ToBytes("abc"),
						false
						);

					EXPECT_EQ("HTTP/1.1 200 OK\r\nContent-Length: 99\r\n\r\nabc", test::ToString(built));
				}

				TEST(HttpMessageBuilderTest, BuiltMessageParsesBack)
				{
					std::vector<char> body{ 'a', '\0', 'b' };
					HttpHeaderLines headers{ "Location: /app.js", "Content-Length: 3" };

					auto built = BuildHttpMessage("HTTP/1.1 200 OK", headers, body);

					HttpResponseParser parser;
					ASSERT_TRUE(parser.Parse(built.data(), built.size()));

					EXPECT_EQ(HttpMessageView("HTTP/1.1 200 OK", headers, body), parser.GetMessage());
				}

			} /* namespace http */
		} /* namespace mitm */
	} /* namespace repairengine */
} /* namespace rr */
