/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <vector>
#include <boost/utility/string_ref.hpp>
#include "../util/cb/EventReporter.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			/// <summary>
			/// Cuts the static "Object moved" notice out of a redirect body, leaving whatever
			/// the server concatenated after (or before) it untouched. Works on raw bytes, since
			/// the remainder is normally compressed binary data.
			/// </summary>
			class BodyCarver : public util::cb::EventReporter
			{

			public:

				/// <summary>
				/// The exact byte sequence the notice begins with.
				/// </summary>
				static const boost::string_ref StubOpening;

				/// <summary>
				/// The exact byte sequence the notice ends with.
				/// </summary>
				static const boost::string_ref StubClosing;

				BodyCarver(
					util::cb::MessageFunction onInfo = nullptr,
					util::cb::MessageFunction onWarning = nullptr,
					util::cb::MessageFunction onError = nullptr
					);

				/// <summary>
				/// Removes the first notice found in the body. The notice spans from the first
				/// StubOpening up to and including the nearest StubClosing that follows it, with
				/// anything at all, line breaks included, in between. At most one notice is
				/// removed.
				/// </summary>
				/// <param name="body">
				/// The raw body to carve.
				/// </param>
				/// <param name="removed">
				/// Optional. Set to whether a notice was found and removed.
				/// </param>
				/// <returns>
				/// The carved body, or a copy of the body if it holds no complete notice.
				/// </returns>
				std::vector<char> RemoveObjectMovedStub(const std::vector<char>& body, bool* removed = nullptr) const;

			};

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
