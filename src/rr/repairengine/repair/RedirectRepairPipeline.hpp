/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include "BodyCarver.hpp"
#include "PayloadDecompressor.hpp"
#include "ResponseRewriter.hpp"
#include "RewriteDecision.hpp"
#include "options/RepairOptions.hpp"
#include "../mitm/http/HttpMessageView.hpp"
#include "../util/cb/EventReporter.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			/// <summary>
			/// Runs a single response through classification, carving, decompression and
			/// rewriting, and decides whether the response is to be replaced.
			///
			/// The decision is all or nothing. If any stage fails, the response is reported as
			/// Unchanged and nothing the earlier stages did to it survives, because serving a
			/// half repaired response is worse than serving the broken original.
			///
			/// The pipeline keeps no per-message state, so one instance can serve any number
			/// of threads at once.
			/// </summary>
			class RedirectRepairPipeline : public util::cb::EventReporter
			{

			public:

				/// <summary>
				/// Constructs the pipeline and its stages, all reporting to the same callbacks.
				/// </summary>
				/// <param name="options">
				/// The options to consult for every message. Must outlive the pipeline.
				/// </param>
				/// <exception cref="std::runtime_error">
				/// If options is nullptr.
				/// </exception>
				RedirectRepairPipeline(
					const options::RepairOptions* options,
					util::cb::MessageFunction onInfo = nullptr,
					util::cb::MessageFunction onWarning = nullptr,
					util::cb::MessageFunction onError = nullptr
					);

				RedirectRepairPipeline(const RedirectRepairPipeline&) = delete;
				RedirectRepairPipeline(RedirectRepairPipeline&&) = delete;
				RedirectRepairPipeline& operator=(const RedirectRepairPipeline&) = delete;

				~RedirectRepairPipeline();

				/// <summary>
				/// Processes one response.
				/// </summary>
				/// <param name="response">
				/// The response as received from the server.
				/// </param>
				/// <param name="resolveUrl">
				/// Resolves the response to the URL of its request. Invoked only if the
				/// response is rewritten. May be nullptr, in which case the URL is left empty.
				/// </param>
				/// <returns>
				/// Unchanged, or the complete replacement response.
				/// </returns>
				RewriteDecision Process(const mitm::http::HttpMessageView& response, const util::cb::UrlResolveFunction& resolveUrl) const;

			private:

				std::string ResolveUrl(const util::cb::UrlResolveFunction& resolveUrl) const;

				const options::RepairOptions* m_options;

				BodyCarver m_carver;

				PayloadDecompressor m_decompressor;

				ResponseRewriter m_rewriter;

			};

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
