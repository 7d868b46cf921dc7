/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include "RepairNotification.hpp"
#include "../mitm/http/HttpMessageView.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			/// <summary>
			/// The outcome of running one response through the repair pipeline. Either the
			/// original response is to be passed through untouched, or it is to be replaced,
			/// as a whole, by the rewritten response held here.
			/// </summary>
			class RewriteDecision
			{

			public:

				/// <summary>
				/// Creates the pass-through decision.
				/// </summary>
				static RewriteDecision Unchanged();

				/// <summary>
				/// Creates a decision to replace the original response.
				/// </summary>
				/// <param name="response">
				/// The complete replacement response.
				/// </param>
				/// <param name="notification">
				/// The notification describing the replacement.
				/// </param>
				static RewriteDecision Rewritten(mitm::http::HttpMessageView response, RepairNotification notification);

				const bool IsRewritten() const;

				/// <summary>
				/// Gets the replacement response.
				/// </summary>
				/// <exception cref="std::logic_error">
				/// If this decision is Unchanged.
				/// </exception>
				const mitm::http::HttpMessageView& GetResponse() const;

				/// <summary>
				/// Gets the notification for the replacement.
				/// </summary>
				/// <exception cref="std::logic_error">
				/// If this decision is Unchanged.
				/// </exception>
				const RepairNotification& GetNotification() const;

			private:

				RewriteDecision();

				bool m_rewritten = false;

				mitm::http::HttpMessageView m_response;

				RepairNotification m_notification;

			};

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
