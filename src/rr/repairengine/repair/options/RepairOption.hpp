/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <cstdint>

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{
			namespace options
			{

				/// <summary>
				/// Enum used to define the switchable behaviours of the repair engine. These keys
				/// are meant to be used internally with the RepairOptions object. For library
				/// implementers, these keys are exposed through the option get/set C API as their
				/// integral values.
				///
				/// When making additions to this enum, values must not be explicitly assigned and
				/// NUMBER_OF_ENTRIES must always be the final entry.
				/// </summary>
				enum class RepairOption : uint32_t
				{
					DecompressJavascriptPayload,
					AnnotateHistory,
					IssueAlerts,
					UpdateContentLength,
					NUMBER_OF_ENTRIES
				};

			} /* namespace options */
		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
