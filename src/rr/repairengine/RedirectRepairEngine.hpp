/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include "util/cb/EventReporter.hpp"
#include "mitm/http/HttpMessageView.hpp"
#include "repair/RewriteDecision.hpp"
#include "repair/RepairNotifier.hpp"
#include "repair/options/RepairOptions.hpp"

namespace rr
{
	namespace repairengine
	{

		namespace repair
		{
			class RedirectRepairPipeline;
		}

		/// <summary>
		/// The host tool a message passed through on its way to us. Only messages captured
		/// by the intercepting proxy are repaired; everything else the host shows us, such as
		/// messages replayed by hand, is left exactly as the user sent or received it.
		/// </summary>
		enum class HostTool : uint32_t
		{
			Proxy,
			Repeater,
			Scanner,
			Other
		};

		/// <summary>
		/// Entry point for a host that intercepts HTTP traffic. The host hands every message
		/// it sees to ProcessHttpMessage(...), and the engine replaces responses that are
		/// broken redirects carrying their target's compressed content with a proper 200
		/// response carrying that content decompressed.
		///
		/// The engine owns its options. Everything else it holds is immutable after
		/// construction, so messages may be processed from any number of threads at once.
		/// </summary>
		class RedirectRepairEngine : public util::cb::EventReporter
		{

		public:

			/// <summary>
			/// Constructs the engine with the given callbacks. None are required.
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
			/// <param name="onWarning">
			/// Callback for warnings about potentially critical events.
			/// </param>
			/// <param name="onError">
			/// Callback for error information about critical events that were handled.
			/// </param>
			RedirectRepairEngine(
				util::cb::AnnotationFunction onAnnotate = nullptr,
				util::cb::MessageFunction onAlert = nullptr,
				util::cb::MessageFunction onInfo = nullptr,
				util::cb::MessageFunction onWarning = nullptr,
				util::cb::MessageFunction onError = nullptr
				);

			RedirectRepairEngine(const RedirectRepairEngine&) = delete;
			RedirectRepairEngine(RedirectRepairEngine&&) = delete;
			RedirectRepairEngine& operator=(const RedirectRepairEngine&) = delete;

			~RedirectRepairEngine();

			/// <summary>
			/// Handles one message the host has intercepted. Requests, and messages from any
			/// tool other than the proxy, are ignored. Responses are parsed, run through the
			/// repair pipeline and, if repaired, rebuilt in place. The history annotation and
			/// alert are then issued, as enabled in the options.
			/// </summary>
			/// <param name="tool">
			/// The host tool the message passed through.
			/// </param>
			/// <param name="isRequest">
			/// Whether the message is a request.
			/// </param>
			/// <param name="message">
			/// The complete raw message. Replaced with the rebuilt response if, and only if,
			/// this method returns true.
			/// </param>
			/// <param name="resolveUrl">
			/// Resolves the message to its request URL.
			/// </param>
			/// <returns>
			/// True if the message was replaced, false if it is to be passed through as is.
			/// </returns>
			const bool ProcessHttpMessage(
				const HostTool tool,
				const bool isRequest,
				std::vector<char>& message,
				const util::cb::UrlResolveFunction& resolveUrl
				) const;

			/// <summary>
			/// Runs an already parsed response through the repair pipeline. No notification
			/// is delivered; that is up to the caller.
			/// </summary>
			repair::RewriteDecision Process(const mitm::http::HttpMessageView& response, const util::cb::UrlResolveFunction& resolveUrl) const;

			repair::options::RepairOptions& GetOptions();

			const repair::options::RepairOptions& GetOptions() const;

		private:

			std::unique_ptr<repair::options::RepairOptions> m_options;

			std::unique_ptr<repair::RedirectRepairPipeline> m_pipeline;

			repair::RepairNotifier m_notifier;

		};

	} /* namespace repairengine */
} /* namespace rr */
