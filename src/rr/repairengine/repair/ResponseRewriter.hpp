/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <string>
#include <vector>
#include "RewriteDecision.hpp"
#include "../mitm/http/HttpMessageView.hpp"
#include "../util/cb/EventReporter.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			/// <summary>
			/// Assembles the final 200 response out of a repair candidate and the body the
			/// earlier stages produced for it, along with the notification that goes with it.
			/// </summary>
			class ResponseRewriter : public util::cb::EventReporter
			{

			public:

				ResponseRewriter(
					util::cb::MessageFunction onInfo = nullptr,
					util::cb::MessageFunction onWarning = nullptr,
					util::cb::MessageFunction onError = nullptr
					);

				/// <summary>
				/// Builds the Rewritten decision.
				/// </summary>
				/// <param name="original">
				/// The candidate response as it was received.
				/// </param>
				/// <param name="body">
				/// The new body.
				/// </param>
				/// <param name="stubRemoved">
				/// Whether the body had the "Object moved" notice carved out. Only used for the
				/// notification summary.
				/// </param>
				/// <param name="decompressed">
				/// Whether the body was inflated. If so, every Content-Encoding header is
				/// dropped.
				/// </param>
				/// <param name="url">
				/// The URL of the request the response answers.
				/// </param>
				RewriteDecision Rewrite(
					const mitm::http::HttpMessageView& original,
					std::vector<char> body,
					const bool stubRemoved,
					const bool decompressed,
					std::string url
					) const;

				/// <summary>
				/// Replaces the status code and reason of a status line with "200 OK". The first
				/// " DDD reason" sequence in the line is what gets replaced. A line with a code
				/// but no reason gets everything from its code token on replaced instead. A line
				/// with no code token at all is returned as is.
				/// </summary>
				static std::string RewriteStatusLine(const std::string& statusLine);

				/// <summary>
				/// Copies the header lines, leaving out every Content-Encoding header. Order is
				/// preserved.
				/// </summary>
				static mitm::http::HttpHeaderLines RemoveContentEncoding(const mitm::http::HttpHeaderLines& headers);

			};

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
