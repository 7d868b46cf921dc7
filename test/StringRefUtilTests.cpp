/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "rr/util/string/StringRefUtil.hpp"

namespace rr
{
	namespace util
	{
		namespace string
		{

			TEST(StringRefUtilTest, IContainsIgnoresCase)
			{
				EXPECT_TRUE(IContains("Application/X-JavaScript; charset=utf-8", "application/x-javascript"));
				EXPECT_TRUE(IContains("gzip", "GZIP"));
				EXPECT_FALSE(IContains("text/javascript", "application/x-javascript"));
				EXPECT_FALSE(IContains("", "gzip"));
			}

			TEST(StringRefUtilTest, SplitWhitespaceDropsEmptyTokens)
			{
				auto tokens = SplitWhitespace("HTTP/1.1  302\tFound ");

				ASSERT_EQ(3u, tokens.size());
				EXPECT_EQ("HTTP/1.1", tokens[0].to_string());
				EXPECT_EQ("302", tokens[1].to_string());
				EXPECT_EQ("Found", tokens[2].to_string());

				EXPECT_TRUE(SplitWhitespace("").empty());
				EXPECT_TRUE(SplitWhitespace(" \t  ").empty());
			}

			TEST(StringRefUtilTest, HeaderNameIsTrimmedTextBeforeColon)
			{
				EXPECT_EQ("Content-Type", HeaderName(" Content-Type : text/html").to_string());
				EXPECT_EQ("Location", HeaderName("Location: http://example.com:8080/").to_string());
				EXPECT_TRUE(HeaderName("NoColonHere").empty());
			}

			TEST(StringRefUtilTest, IsHeaderNamedComparesWholeNameIgnoringCase)
			{
				EXPECT_TRUE(IsHeaderNamed("content-encoding: gzip", "Content-Encoding"));
				EXPECT_TRUE(IsHeaderNamed("CONTENT-ENCODING:gzip", "Content-Encoding"));
				EXPECT_FALSE(IsHeaderNamed("X-Content-Encoding: gzip", "Content-Encoding"));
				EXPECT_FALSE(IsHeaderNamed("Content-Encoding-Extra: gzip", "Content-Encoding"));
				EXPECT_FALSE(IsHeaderNamed("Content-Encoding gzip", "Content-Encoding"));
			}

			TEST(StringRefUtilTest, FindBytesHandlesBinaryData)
			{
				std::vector<char> data{ 'a', '\0', 'b', '\x1f', '\x8b', '\0', '\x1f', '\x8b' };
				boost::string_ref signature("\x1f\x8b", 2);

				EXPECT_EQ(3u, FindBytes(data, signature));
				EXPECT_EQ(6u, FindBytes(data, signature, 4));
				EXPECT_EQ(std::string::npos, FindBytes(data, signature, 7));
				EXPECT_EQ(std::string::npos, FindBytes(data, signature, data.size() + 1));
				EXPECT_EQ(std::string::npos, FindBytes(data, boost::string_ref()));
				EXPECT_EQ(std::string::npos, FindBytes(std::vector<char>(), signature));
			}

		} /* namespace string */
	} /* namespace util */
} /* namespace rr */
