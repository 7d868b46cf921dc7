/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include "BodyCarver.hpp"
#include "../../util/string/StringRefUtil.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			const boost::string_ref BodyCarver::StubOpening = u8"<html><head><title>Object moved</title></head><body>";

			const boost::string_ref BodyCarver::StubClosing = u8"</body></html>";

			BodyCarver::BodyCarver(
				util::cb::MessageFunction onInfo,
				util::cb::MessageFunction onWarning,
				util::cb::MessageFunction onError
				)
				:
				util::cb::EventReporter(onInfo, onWarning, onError)
			{

			}

			std::vector<char> BodyCarver::RemoveObjectMovedStub(const std::vector<char>& body, bool* removed) const
			{
				if (removed != nullptr)
				{
					*removed = false;
				}

				auto start = rr::util::string::FindBytes(body, StubOpening);

				if (start == boost::string_ref::npos)
				{
					return body;
				}

				// If the first opening has no closing after it, no later opening can either.
				auto close = rr::util::string::FindBytes(body, StubClosing, start + StubOpening.size());

				if (close == boost::string_ref::npos)
				{
					return body;
				}

				auto end = close + StubClosing.size();

				std::vector<char> carved;
				carved.reserve(body.size() - (end - start));
				carved.insert(carved.end(), body.begin(), body.begin() + start);
				carved.insert(carved.end(), body.begin() + end, body.end());

				if (removed != nullptr)
				{
					*removed = true;
				}

				ReportInfo(u8"In BodyCarver::RemoveObjectMovedStub(...) - Removed 'Object moved' redirect HTML from body.");

				return carved;
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
