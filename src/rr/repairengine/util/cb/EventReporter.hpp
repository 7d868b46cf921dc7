/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/


#pragma once

#include "EngineCallbackTypes.h"
#include <string>
#include <thread>
#include <boost/utility/string_ref.hpp>

namespace rr
{
	namespace repairengine
	{
		namespace util
		{
			namespace cb
			{

				/// <summary>
				/// The EventReporter holds the info, warning and error callbacks supplied by the
				/// user of this library and provides a simple interface for invoking them. Every
				/// stage of the repair pipeline inherits from this class so that diagnostics all
				/// flow to the same place, regardless of which stage produced them.
				///
				/// None of the callbacks are required. A null callback simply means the matching
				/// category of messages is dropped.
				///
				/// Invoking the callbacks holds no lock. If the supplied callbacks are not safe to
				/// call from multiple threads at once, the user must make them so.
				/// </summary>
				class EventReporter
				{

				public:

					/// <summary>
					/// Constructs members with the given arguments.
					/// </summary>
					/// <param name="onInfo">
					/// Callback for general information about non-critical events.
					/// </param>
					/// <param name="onWarning">
					/// Callback for warnings about potentially critical events.
					/// </param>
					/// <param name="onError">
					/// Callback for error information about critical events that were handled.
					/// </param>
					EventReporter(
						MessageFunction onInfo = nullptr,
						MessageFunction onWarning = nullptr,
						MessageFunction onError = nullptr
						) :
						m_onInfo(onInfo),
						m_onWarning(onWarning),
						m_onError(onError)
					{

					}

					virtual ~EventReporter()
					{

					}

					/// <summary>
					/// If the info callback member is valid, invokes it with the informational
					/// message data as arguments.
					/// </summary>
					virtual void ReportInfo(const boost::string_ref infoMessage) const
					{
						Report(m_onInfo, infoMessage);
					}

					/// <summary>
					/// If the warning callback member is valid, invokes it with the warning message
					/// data as arguments.
					/// </summary>
					virtual void ReportWarning(const boost::string_ref warningMessage) const
					{
						Report(m_onWarning, warningMessage);
					}

					/// <summary>
					/// If the error callback member is valid, invokes it with the error message
					/// data as arguments.
					/// </summary>
					virtual void ReportError(const boost::string_ref errorMessage) const
					{
						Report(m_onError, errorMessage);
					}

				protected:

					/// <summary>
					/// Gives derived classes the means to hand their own callbacks down to the
					/// objects they compose, so that everything reports to the same sinks.
					/// </summary>
					const MessageFunction& GetOnInfo() const
					{
						return m_onInfo;
					}

					const MessageFunction& GetOnWarning() const
					{
						return m_onWarning;
					}

					const MessageFunction& GetOnError() const
					{
						return m_onError;
					}

				private:

					static void Report(const MessageFunction& sink, const boost::string_ref message)
					{
						if (!sink || !message.data())
						{
							return;
						}

						#ifndef NDEBUG
							std::string m = u8"From Thread " + std::to_string(std::hash<std::thread::id>()(std::this_thread::get_id()));
							m.append(": ").append(message.begin(), message.end());
							sink(m.c_str(), m.size());
						#else
							sink(message.begin(), message.size());
						#endif
					}

					/// <summary>
					/// Callback for general information about non-critical events.
					/// </summary>
					MessageFunction m_onInfo;

					/// <summary>
					/// Callback for warnings about potentially critical events.
					/// </summary>
					MessageFunction m_onWarning;

					/// <summary>
					/// Callback for error information about critical events that were handled.
					/// </summary>
					MessageFunction m_onError;

				};

			} /* namespace cb */
		} /* namespace util */
	} /* namespace repairengine */
} /* namespace rr */
