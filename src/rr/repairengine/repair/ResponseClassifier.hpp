/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <cstddef>
#include <boost/utility/string_ref.hpp>
#include "../mitm/http/HttpMessageView.hpp"
#include "options/RepairOptions.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			/// <summary>
			/// Decides whether a response looks like a redirect that is carrying a misplaced
			/// payload: any 3xx response, with headers, whose body is larger than a short
			/// "moved" notice could ever be. The decision looks at the status line, header
			/// presence and body length only.
			/// </summary>
			class ResponseClassifier
			{

			public:

				/// <param name="bodyThreshold">
				/// Number of body bytes a response must exceed to be a candidate.
				/// </param>
				explicit ResponseClassifier(const size_t bodyThreshold = options::RepairOptions::DefaultCandidateBodyThreshold);

				/// <summary>
				/// Checks whether the supplied response is a repair candidate. Malformed
				/// status lines simply make the response a non-candidate.
				/// </summary>
				const bool IsCandidate(const mitm::http::HttpMessageView& response) const;

				/// <summary>
				/// Gets the status code token of a status line, which is the second
				/// whitespace delimited token.
				/// </summary>
				/// <returns>
				/// The status code token, pointing into statusLine, or an empty string_ref if
				/// the line has fewer than two tokens.
				/// </returns>
				static boost::string_ref GetStatusCodeToken(const boost::string_ref statusLine);

				const size_t GetBodyThreshold() const;

			private:

				size_t m_bodyThreshold;

			};

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
