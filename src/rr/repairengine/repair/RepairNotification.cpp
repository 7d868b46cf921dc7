/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <utility>
#include "RepairNotification.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			const std::string RepairNotification::HighlightColor{ u8"cyan" };

			RepairNotification::RepairNotification()
			{

			}

			RepairNotification::RepairNotification(std::string url, std::string summary)
				:
				m_url(std::move(url)),
				m_summary(std::move(summary))
			{

			}

			const std::string& RepairNotification::GetUrl() const
			{
				return m_url;
			}

			const std::string& RepairNotification::GetSummary() const
			{
				return m_summary;
			}

			std::string RepairNotification::GetHistoryComment() const
			{
				return std::string(u8"Redirect modified and decompressed for URL: ").append(m_url);
			}

			std::string RepairNotification::GetAlertMessage() const
			{
				return std::string(u8"Modified response for URL: ").append(m_url);
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
