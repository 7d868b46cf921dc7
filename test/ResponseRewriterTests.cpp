/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "TestUtil.hpp"
#include "rr/repairengine/repair/ResponseRewriter.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			TEST(ResponseRewriterTest, RewritesStatusLine)
			{
				EXPECT_EQ("HTTP/1.1 200 OK", ResponseRewriter::RewriteStatusLine("HTTP/1.1 302 Found"));
				EXPECT_EQ("HTTP/1.0 200 OK", ResponseRewriter::RewriteStatusLine("HTTP/1.0 301 Moved Permanently"));
				EXPECT_EQ("HTTP/1.1 200 OK", ResponseRewriter::RewriteStatusLine("HTTP/1.1 307 Temporary Redirect 404 Extra"));
			}

			TEST(ResponseRewriterTest, RewritesStatusLineWithoutReasonPhrase)
			{
				EXPECT_EQ("HTTP/1.1 200 OK", ResponseRewriter::RewriteStatusLine("HTTP/1.1 302"));
				EXPECT_EQ("HTTP/1.1 200 OK", ResponseRewriter::RewriteStatusLine("HTTP/1.1 302 "));
			}

			TEST(ResponseRewriterTest, LeavesUnrecognizedStatusLine)
			{
				EXPECT_EQ("Garbage", ResponseRewriter::RewriteStatusLine("Garbage"));
				EXPECT_EQ("", ResponseRewriter::RewriteStatusLine(""));
			}

			TEST(ResponseRewriterTest, RemovesEveryContentEncodingKeepingOrder)
			{
				mitm::http::HttpHeaderLines headers{
					"Content-Type: application/x-javascript",
					"Content-Encoding: gzip",
					"Cache-Control: no-cache",
					"content-encoding: deflate",
					"X-Content-Encoding: kept"
				};

				mitm::http::HttpHeaderLines expected{
					"Content-Type: application/x-javascript",
					"Cache-Control: no-cache",
					"X-Content-Encoding: kept"
				};

				EXPECT_EQ(expected, ResponseRewriter::RemoveContentEncoding(headers));
			}

			TEST(ResponseRewriterTest, RewriteAfterDecompression)
			{
				ResponseRewriter rewriter;

				mitm::http::HttpHeaderLines headers{ "Content-Type: application/x-javascript", "Content-Encoding: gzip", "Location: /a.js" };
				auto original = test::MakeResponse("HTTP/1.1 302 Found", headers, test::Padding(1500));

				auto decision = rewriter.Rewrite(original, test::ToBytes("var x=1;"), true, true, "http://example.com/a.js");

				ASSERT_TRUE(decision.IsRewritten());

				const auto& response = decision.GetResponse();

				EXPECT_EQ("HTTP/1.1 200 OK", response.GetStatusLine());
				EXPECT_EQ((mitm::http::HttpHeaderLines{ "Content-Type: application/x-javascript", "Location: /a.js" }), response.GetHeaders());
				EXPECT_EQ("var x=1;", test::ToString(response.GetBody()));

				const auto& notification = decision.GetNotification();

				EXPECT_EQ("http://example.com/a.js", notification.GetUrl());
				EXPECT_EQ(
					"Status changed: HTTP/1.1 302 Found -> HTTP/1.1 200 OK (body size 1500 bytes), 'Object moved' HTML removed, GZIP payload decompressed.",
					notification.GetSummary());
				EXPECT_EQ("Redirect modified and decompressed for URL: http://example.com/a.js", notification.GetHistoryComment());
				EXPECT_EQ("Modified response for URL: http://example.com/a.js", notification.GetAlertMessage());
				EXPECT_EQ("cyan", RepairNotification::HighlightColor);
			}

			TEST(ResponseRewriterTest, RewriteWithoutDecompressionKeepsHeaders)
			{
				ResponseRewriter rewriter;

				mitm::http::HttpHeaderLines headers{ "Content-Type: text/html", "Content-Encoding: gzip" };
				auto original = test::MakeResponse("HTTP/1.1 301 Moved Permanently", headers, test::Padding(1200));

				auto decision = rewriter.Rewrite(original, test::Padding(1200), false, false, "");

				ASSERT_TRUE(decision.IsRewritten());
				EXPECT_EQ(headers, decision.GetResponse().GetHeaders());
				EXPECT_EQ(
					"Status changed: HTTP/1.1 301 Moved Permanently -> HTTP/1.1 200 OK (body size 1200 bytes).",
					decision.GetNotification().GetSummary());
			}

			TEST(ResponseRewriterTest, UnchangedDecisionHasNoResponse)
			{
				auto decision = RewriteDecision::Unchanged();

				EXPECT_FALSE(decision.IsRewritten());
				EXPECT_THROW(decision.GetResponse(), std::logic_error);
				EXPECT_THROW(decision.GetNotification(), std::logic_error);
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
