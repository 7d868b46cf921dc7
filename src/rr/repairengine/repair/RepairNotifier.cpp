/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <string>
#include <stdexcept>
#include "RepairNotifier.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			RepairNotifier::RepairNotifier(
				util::cb::AnnotationFunction onAnnotate,
				util::cb::MessageFunction onAlert,
				util::cb::MessageFunction onInfo,
				util::cb::MessageFunction onWarning,
				util::cb::MessageFunction onError
				)
				:
				util::cb::EventReporter(onInfo, onWarning, onError),
				m_onAnnotate(onAnnotate),
				m_onAlert(onAlert)
			{

			}

			void RepairNotifier::Notify(const RepairNotification& notification, const bool annotate, const bool alert) const
			{
				if (annotate && m_onAnnotate)
				{
					try
					{
						const auto& color = RepairNotification::HighlightColor;
						auto comment = notification.GetHistoryComment();
						m_onAnnotate(color.c_str(), color.size(), comment.c_str(), comment.size());
					}
					catch (std::exception& e)
					{
						std::string errMessage(u8"In RepairNotifier::Notify(...) - History annotation callback threw: ");
						errMessage.append(e.what());
						ReportError(errMessage);
					}
				}

				if (alert && m_onAlert)
				{
					try
					{
						auto message = notification.GetAlertMessage();
						m_onAlert(message.c_str(), message.size());
					}
					catch (std::exception& e)
					{
						std::string errMessage(u8"In RepairNotifier::Notify(...) - Alert callback threw: ");
						errMessage.append(e.what());
						ReportError(errMessage);
					}
				}
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
