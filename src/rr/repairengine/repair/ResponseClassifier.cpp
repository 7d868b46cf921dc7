/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include "ResponseClassifier.hpp"
#include "../../util/string/StringRefUtil.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			ResponseClassifier::ResponseClassifier(const size_t bodyThreshold) : m_bodyThreshold(bodyThreshold)
			{

			}

			const bool ResponseClassifier::IsCandidate(const mitm::http::HttpMessageView& response) const
			{
				if (response.GetHeaders().empty())
				{
					return false;
				}

				auto code = GetStatusCodeToken(response.GetStatusLine());

				if (code.empty() || code.front() != '3')
				{
					return false;
				}

				return response.GetBody().size() > m_bodyThreshold;
			}

			boost::string_ref ResponseClassifier::GetStatusCodeToken(const boost::string_ref statusLine)
			{
				auto tokens = rr::util::string::SplitWhitespace(statusLine);

				if (tokens.size() < 2)
				{
					return boost::string_ref();
				}

				return tokens[1];
			}

			const size_t ResponseClassifier::GetBodyThreshold() const
			{
				return m_bodyThreshold;
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
