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
#include "rr/repairengine/repair/ResponseClassifier.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			namespace
			{
				const mitm::http::HttpHeaderLines DefaultHeaders{ "Content-Type: application/x-javascript" };
			}

			TEST(ResponseClassifierTest, RedirectWithLargeBodyIsCandidate)
			{
				ResponseClassifier classifier;

				EXPECT_EQ(1000u, classifier.GetBodyThreshold());
				EXPECT_TRUE(classifier.IsCandidate(test::MakeResponse("HTTP/1.1 302 Found", DefaultHeaders, test::Padding(1001))));
			}

			TEST(ResponseClassifierTest, ThresholdIsExclusive)
			{
				ResponseClassifier classifier;

				EXPECT_FALSE(classifier.IsCandidate(test::MakeResponse("HTTP/1.1 302 Found", DefaultHeaders, test::Padding(1000))));
				EXPECT_FALSE(classifier.IsCandidate(test::MakeResponse("HTTP/1.1 302 Found", DefaultHeaders, test::Padding(50))));
				EXPECT_FALSE(classifier.IsCandidate(test::MakeResponse("HTTP/1.1 302 Found", DefaultHeaders, std::vector<char>())));
			}

			TEST(ResponseClassifierTest, OnlyThreeHundredClassIsCandidate)
			{
				ResponseClassifier classifier;
				auto body = test::Padding(2048);

				for (int code = 100; code < 600; ++code)
				{
					auto statusLine = std::string("HTTP/1.1 ") + std::to_string(code) + " Reason";
					bool expected = code >= 300 && code < 400;

					EXPECT_EQ(expected, classifier.IsCandidate(test::MakeResponse(statusLine, DefaultHeaders, body))) << statusLine;
				}
			}

			TEST(ResponseClassifierTest, EmptyHeadersAreNotCandidate)
			{
				ResponseClassifier classifier;

				EXPECT_FALSE(classifier.IsCandidate(test::MakeResponse("HTTP/1.1 302 Found", {}, test::Padding(2048))));
			}

			TEST(ResponseClassifierTest, MalformedStatusLineIsNotCandidate)
			{
				ResponseClassifier classifier;
				auto body = test::Padding(2048);

				EXPECT_FALSE(classifier.IsCandidate(test::MakeResponse("", DefaultHeaders, body)));
				EXPECT_FALSE(classifier.IsCandidate(test::MakeResponse("HTTP/1.1", DefaultHeaders, body)));
				EXPECT_FALSE(classifier.IsCandidate(test::MakeResponse("302", DefaultHeaders, body)));
			}

			TEST(ResponseClassifierTest, CustomThreshold)
			{
				ResponseClassifier classifier(10);

				EXPECT_TRUE(classifier.IsCandidate(test::MakeResponse("HTTP/1.1 301 Moved", DefaultHeaders, test::Padding(11))));
				EXPECT_FALSE(classifier.IsCandidate(test::MakeResponse("HTTP/1.1 301 Moved", DefaultHeaders, test::Padding(10))));
			}

			TEST(ResponseClassifierTest, StatusCodeTokenIsSecondToken)
			{
				EXPECT_EQ("302", ResponseClassifier::GetStatusCodeToken("HTTP/1.1 302 Found").to_string());
				EXPECT_EQ("307", ResponseClassifier::GetStatusCodeToken("HTTP/1.0\t307").to_string());
				EXPECT_EQ("301", ResponseClassifier::GetStatusCodeToken("  HTTP/1.1   301   Moved Permanently").to_string());
				EXPECT_TRUE(ResponseClassifier::GetStatusCodeToken("HTTP/1.1").empty());
				EXPECT_TRUE(ResponseClassifier::GetStatusCodeToken("").empty());
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
