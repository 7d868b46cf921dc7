/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#ifndef __cplusplus
	#include <stdbool.h>
#endif

#include "util/cb/EngineCallbackTypes.h"

#ifdef RR_REPAIR_ENGINE_EXPORT
	#if defined(_WIN32) && defined(_MSC_VER)
		#define RR_REPAIR_ENGINE_API __declspec(dllexport)
	#else
		#define RR_REPAIR_ENGINE_API __attribute__((visibility("default")))
	#endif
#else
	#if defined(_WIN32) && defined(_MSC_VER)
		#define RR_REPAIR_ENGINE_API __declspec(dllimport)
	#else
		#define RR_REPAIR_ENGINE_API
	#endif
#endif // #ifdef RR_REPAIR_ENGINE_EXPORT

#ifdef __cplusplus
extern "C" {
#endif // __cplusplus

	/// <summary>
	/// Creates a new instance of the repair engine. No callback is required.
	/// </summary>
	/// <param name="onAnnotate">
	/// Invoked with a highlight color and comment for every repaired message.
	/// </param>
	/// <param name="onAlert">
	/// Invoked with a one line alert for every repaired message.
	/// </param>
	/// <param name="onInfo">
	/// Callback for general information about non-critical events.
	/// </param>
	/// <param name="onWarn">
	/// Callback for warnings about potentially critical events.
	/// </param>
	/// <param name="onError">
	/// Callback for error information about critical events that were handled.
	/// </param>
	/// <returns>
	/// An opaque handle to the new engine, or nullptr if it could not be created.
	/// </returns>
	RR_REPAIR_ENGINE_API void* rr_engine_create(
		HistoryAnnotationCallback onAnnotate,
		IssueAlertCallback onAlert,
		ReportMessageCallback onInfo,
		ReportMessageCallback onWarn,
		ReportMessageCallback onError
		);

	/// <summary>
	/// Destroys an engine created with rr_engine_create(...) and sets the supplied handle to
	/// nullptr.
	/// </summary>
	RR_REPAIR_ENGINE_API void rr_engine_destroy(void** ptr);

	/// <summary>
	/// Runs one complete raw response captured by the proxy through the engine.
	/// </summary>
	/// <param name="ptr">
	/// The engine handle.
	/// </param>
	/// <param name="response">
	/// The raw response bytes.
	/// </param>
	/// <param name="responseLength">
	/// The length of the raw response.
	/// </param>
	/// <param name="url">
	/// The URL of the request the response answers. Used in the notifications only.
	/// </param>
	/// <param name="urlLength">
	/// The length of the URL.
	/// </param>
	/// <param name="writer">
	/// Receives the rebuilt response, if the response was repaired.
	/// </param>
	/// <returns>
	/// True if the response was repaired and the rebuilt response was written to the writer,
	/// false if the original response is to be passed through.
	/// </returns>
	RR_REPAIR_ENGINE_API bool rr_engine_process_response(
		void* ptr,
		const char* response,
		const uint32_t responseLength,
		const char* url,
		const uint32_t urlLength,
		CustomResponseStreamWriter writer
		);

	/// <summary>
	/// Gets whether an engine option is enabled. The option is the integral value of the
	/// RepairOption enum. Unknown options are reported as disabled.
	/// </summary>
	RR_REPAIR_ENGINE_API bool rr_engine_get_option(void* ptr, const uint32_t option);

	/// <summary>
	/// Sets whether an engine option is enabled. Unknown options are ignored.
	/// </summary>
	RR_REPAIR_ENGINE_API void rr_engine_set_option(void* ptr, const uint32_t option, const bool value);

	/// <summary>
	/// Gets the number of body bytes a redirect must exceed before it is repaired.
	/// </summary>
	RR_REPAIR_ENGINE_API uint32_t rr_engine_get_candidate_threshold(void* ptr);

	/// <summary>
	/// Sets the number of body bytes a redirect must exceed before it is repaired.
	/// </summary>
	RR_REPAIR_ENGINE_API void rr_engine_set_candidate_threshold(void* ptr, const uint32_t threshold);

#ifdef __cplusplus
}
#endif // __cplusplus
