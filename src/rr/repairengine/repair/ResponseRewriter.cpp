/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <cctype>
#include <utility>
#include "ResponseRewriter.hpp"
#include "ResponseClassifier.hpp"
#include "../../util/http/KnownHttpHeaders.hpp"
#include "../../util/string/StringRefUtil.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			namespace
			{
				inline bool IsDigit(const char c)
				{
					return std::isdigit(static_cast<unsigned char>(c)) != 0;
				}
			}

			ResponseRewriter::ResponseRewriter(
				util::cb::MessageFunction onInfo,
				util::cb::MessageFunction onWarning,
				util::cb::MessageFunction onError
				)
				:
				util::cb::EventReporter(onInfo, onWarning, onError)
			{

			}

			RewriteDecision ResponseRewriter::Rewrite(
				const mitm::http::HttpMessageView& original,
				std::vector<char> body,
				const bool stubRemoved,
				const bool decompressed,
				std::string url
				) const
			{
				auto statusLine = RewriteStatusLine(original.GetStatusLine());

				std::string summary(u8"Status changed: ");
				summary.append(original.GetStatusLine()).append(u8" -> ").append(statusLine);
				summary.append(u8" (body size ").append(std::to_string(original.GetBody().size())).append(u8" bytes)");

				ReportInfo(std::string(u8"In ResponseRewriter::Rewrite(...) - ") + summary);

				if (stubRemoved)
				{
					summary.append(u8", 'Object moved' HTML removed");
				}

				mitm::http::HttpHeaderLines headers;

				if (decompressed)
				{
					headers = RemoveContentEncoding(original.GetHeaders());
					summary.append(u8", GZIP payload decompressed");
				}
				else
				{
					headers = original.GetHeaders();
				}

				summary.append(u8".");

				return RewriteDecision::Rewritten(
					mitm::http::HttpMessageView(std::move(statusLine), std::move(headers), std::move(body)),
					RepairNotification(std::move(url), std::move(summary))
					);
			}

			std::string ResponseRewriter::RewriteStatusLine(const std::string& statusLine)
			{
				// " DDD " followed by at least one more character.
				for (size_t i = 0; i + 5 < statusLine.size(); ++i)
				{
					if (statusLine[i] == ' ' &&
						IsDigit(statusLine[i + 1]) &&
						IsDigit(statusLine[i + 2]) &&
						IsDigit(statusLine[i + 3]) &&
						statusLine[i + 4] == ' ')
					{
						return statusLine.substr(0, i).append(u8" 200 OK");
					}
				}

				auto code = ResponseClassifier::GetStatusCodeToken(statusLine);

				if (code.empty())
				{
					return statusLine;
				}

				auto offset = static_cast<size_t>(code.data() - statusLine.data());

				return statusLine.substr(0, offset).append(u8"200 OK");
			}

			mitm::http::HttpHeaderLines ResponseRewriter::RemoveContentEncoding(const mitm::http::HttpHeaderLines& headers)
			{
				mitm::http::HttpHeaderLines ret;
				ret.reserve(headers.size());

				for (const auto& header : headers)
				{
					if (!rr::util::string::IsHeaderNamed(header, rr::util::http::headers::ContentEncoding))
					{
						ret.push_back(header);
					}
				}

				return ret;
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
