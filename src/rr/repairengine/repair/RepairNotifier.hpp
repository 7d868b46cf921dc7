/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include "RepairNotification.hpp"
#include "../util/cb/EventReporter.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			/// <summary>
			/// Delivers a RepairNotification to the host: a highlight and comment on the
			/// history entry, and an operator alert. Delivery is fire and forget. A sink that
			/// throws is reported through the error callback and otherwise ignored.
			/// </summary>
			class RepairNotifier : public util::cb::EventReporter
			{

			public:

				RepairNotifier(
					util::cb::AnnotationFunction onAnnotate = nullptr,
					util::cb::MessageFunction onAlert = nullptr,
					util::cb::MessageFunction onInfo = nullptr,
					util::cb::MessageFunction onWarning = nullptr,
					util::cb::MessageFunction onError = nullptr
					);

				/// <summary>
				/// Hands the notification to whichever sinks are both supplied and enabled.
				/// </summary>
				/// <param name="notification">
				/// The notification to deliver.
				/// </param>
				/// <param name="annotate">
				/// Whether to apply the history highlight and comment.
				/// </param>
				/// <param name="alert">
				/// Whether to issue the alert.
				/// </param>
				void Notify(const RepairNotification& notification, const bool annotate, const bool alert) const;

			private:

				util::cb::AnnotationFunction m_onAnnotate;

				util::cb::MessageFunction m_onAlert;

			};

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
