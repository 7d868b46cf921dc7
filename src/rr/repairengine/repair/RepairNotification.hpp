/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <string>

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			/// <summary>
			/// Describes one repaired response to the outside world. Holds the URL of the
			/// request the response belongs to and a human readable summary of what was
			/// changed, and derives from those the exact texts handed to the host's history
			/// annotation and alert sinks.
			/// </summary>
			class RepairNotification
			{

			public:

				/// <summary>
				/// Color used to highlight repaired entries in the host's history.
				/// </summary>
				static const std::string HighlightColor;

				RepairNotification();

				RepairNotification(std::string url, std::string summary);

				const std::string& GetUrl() const;

				const std::string& GetSummary() const;

				/// <summary>
				/// Gets the comment to attach to the history entry of the repaired message.
				/// </summary>
				/// <returns>
				/// "Redirect modified and decompressed for URL: " followed by the URL.
				/// </returns>
				std::string GetHistoryComment() const;

				/// <summary>
				/// Gets the one line operator alert for the repaired message.
				/// </summary>
				/// <returns>
				/// "Modified response for URL: " followed by the URL.
				/// </returns>
				std::string GetAlertMessage() const;

			private:

				std::string m_url;

				std::string m_summary;

			};

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
