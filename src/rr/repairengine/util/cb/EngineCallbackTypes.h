/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#ifdef __cplusplus
	#include <cstdint>
	#include <functional>
	#include <string>
#else
	#include <stdint.h>
	#include <stddef.h>
#endif //#ifdef __cplusplus

/// <summary>
/// The Engine handles any error that occurs in situations related to external input. This is
/// because the very nature of the Engine is to deal with unpredictable external input, such as
/// broken responses from misconfigured servers. To still give some insight and feedback to users,
/// various callbacks are used for errors, warnings, and general information.
///
/// When constructing a new instance of the Engine, these callbacks should be provided to the
/// construction mechanism.
/// </summary>
typedef void(*ReportMessageCallback)(const char* message, const uint32_t messageLength);

/// <summary>
/// Invoked once for every response the Engine has rewritten, so that the host can mark the
/// matching entry in its history view. The color is a plain color name, such as "cyan".
/// </summary>
typedef void(*HistoryAnnotationCallback)(const char* color, const uint32_t colorLength, const char* comment, const uint32_t commentLength);

/// <summary>
/// Invoked once for every response the Engine has rewritten, with a one line, operator facing
/// alert string.
/// </summary>
typedef void(*IssueAlertCallback)(const char* message, const uint32_t messageLength);

/// <summary>
/// Used to hand a rebuilt message back to the host. May be invoked multiple times for a single
/// message, in which case the data is to be appended in order.
/// </summary>
typedef void(*CustomResponseStreamWriter)(const char* data, const uint32_t dataLength);

#ifdef __cplusplus
namespace rr
{
	namespace repairengine
	{
		namespace util
		{
			namespace cb
			{

				using MessageFunction = std::function<void(const char* message, const size_t messageLength)>;

				using AnnotationFunction = std::function<void(const char* color, const size_t colorLength, const char* comment, const size_t commentLength)>;

				/// <summary>
				/// Resolves the message currently being processed to the URL of its originating
				/// request. Only invoked for messages which are actually rewritten.
				/// </summary>
				using UrlResolveFunction = std::function<std::string()>;

			} /* namespace cb */
		} /* namespace util */
	} /* namespace repairengine */
} /* namespace rr */
#endif //#ifdef __cplusplus
