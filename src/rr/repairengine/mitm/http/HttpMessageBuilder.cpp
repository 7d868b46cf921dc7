/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include "HttpMessageBuilder.hpp"
#include "../../../util/http/KnownHttpHeaders.hpp"
#include "../../../util/string/StringRefUtil.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace mitm
		{
			namespace http
			{

				namespace knownheaders = rr::util::http::headers;
				namespace knownvalues = rr::util::http::values;

				std::string HeadersToString(const std::string& statusLine, const HttpHeaderLines& headers)
				{
					std::string ret;

					ret.append(statusLine);

					for (auto header = headers.begin(); header != headers.end(); ++header)
					{
						ret.append(u8"\r\n").append(*header);
					}

					ret.append(u8"\r\n\r\n");

					return ret;
				}

				std::vector<char> BuildHttpMessage(
					const std::string& statusLine,
					const HttpHeaderLines& headers,
					const std::vector<char>& body,
					const bool updateContentLength
					)
				{
					HttpHeaderLines finalHeaders;
					finalHeaders.reserve(headers.size() + 1);

					bool lengthWritten = false;
					bool lengthPresent = false;
					bool chunkedDropped = false;
					std::string lengthHeader = knownheaders::ContentLength + u8": " + std::to_string(body.size());

					for (const auto& line : headers)
					{
						if (rr::util::string::IsHeaderNamed(line, knownheaders::TransferEncoding) &&
							rr::util::string::IContains(line, knownvalues::TransferEncodingChunked))
						{
							chunkedDropped = true;
							continue;
						}

						if (rr::util::string::IsHeaderNamed(line, knownheaders::ContentLength))
						{
							lengthPresent = true;

							if (!updateContentLength)
							{
								finalHeaders.push_back(line);
								continue;
							}

							if (!lengthWritten)
							{
								finalHeaders.push_back(lengthHeader);
								lengthWritten = true;
							}

							continue;
						}

						finalHeaders.push_back(line);
					}

					if (!lengthWritten && (updateContentLength || (chunkedDropped && !lengthPresent)))
					{
						finalHeaders.push_back(lengthHeader);
					}

					auto headerBlock = HeadersToString(statusLine, finalHeaders);

					std::vector<char> ret;
					ret.reserve(headerBlock.size() + body.size());
					ret.insert(ret.end(), headerBlock.begin(), headerBlock.end());
					ret.insert(ret.end(), body.begin(), body.end());

					return ret;
				}

			} /* namespace http */
		} /* namespace mitm */
	} /* namespace repairengine */
} /* namespace rr */
