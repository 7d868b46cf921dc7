/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <stdexcept>
#include <utility>
#include "RewriteDecision.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			RewriteDecision::RewriteDecision()
			{

			}

			RewriteDecision RewriteDecision::Unchanged()
			{
				return RewriteDecision();
			}

			RewriteDecision RewriteDecision::Rewritten(mitm::http::HttpMessageView response, RepairNotification notification)
			{
				RewriteDecision ret;
				ret.m_rewritten = true;
				ret.m_response = std::move(response);
				ret.m_notification = std::move(notification);
				return ret;
			}

			const bool RewriteDecision::IsRewritten() const
			{
				return m_rewritten;
			}

			const mitm::http::HttpMessageView& RewriteDecision::GetResponse() const
			{
				if (!m_rewritten)
				{
					throw std::logic_error(u8"In RewriteDecision::GetResponse() - The decision is Unchanged, there is no replacement response.");
				}

				return m_response;
			}

			const RepairNotification& RewriteDecision::GetNotification() const
			{
				if (!m_rewritten)
				{
					throw std::logic_error(u8"In RewriteDecision::GetNotification() - The decision is Unchanged, there is no notification.");
				}

				return m_notification;
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
