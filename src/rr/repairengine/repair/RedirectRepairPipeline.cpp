/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <stdexcept>
#include <utility>
#include "RedirectRepairPipeline.hpp"
#include "ResponseClassifier.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			RedirectRepairPipeline::RedirectRepairPipeline(
				const options::RepairOptions* options,
				util::cb::MessageFunction onInfo,
				util::cb::MessageFunction onWarning,
				util::cb::MessageFunction onError
				)
				:
				util::cb::EventReporter(onInfo, onWarning, onError),
				m_options(options),
				m_carver(onInfo, onWarning, onError),
				m_decompressor(onInfo, onWarning, onError),
				m_rewriter(onInfo, onWarning, onError)
			{
				if (m_options == nullptr)
				{
					throw std::runtime_error(u8"In RedirectRepairPipeline::RedirectRepairPipeline(...) - Supplied options pointer is nullptr.");
				}
			}

			RedirectRepairPipeline::~RedirectRepairPipeline()
			{

			}

			RewriteDecision RedirectRepairPipeline::Process(const mitm::http::HttpMessageView& response, const util::cb::UrlResolveFunction& resolveUrl) const
			{
				ResponseClassifier classifier(m_options->GetCandidateBodyThreshold());

				if (!classifier.IsCandidate(response))
				{
					return RewriteDecision::Unchanged();
				}

				bool stubRemoved = false;
				auto body = m_carver.RemoveObjectMovedStub(response.GetBody(), &stubRemoved);

				bool decompressed = false;

				if (m_options->GetIsOptionEnabled(options::RepairOption::DecompressJavascriptPayload))
				{
					std::vector<char> inflated;

					switch (m_decompressor.TryDecompress(response.GetHeaders(), body, inflated))
					{
						case DecompressionOutcome::Succeeded:
						{
							body = std::move(inflated);
							decompressed = true;
						}
						break;

						case DecompressionOutcome::Failed:
						{
							ReportError(u8"In RedirectRepairPipeline::Process(...) - Payload could not be decompressed, serving the original response.");
							return RewriteDecision::Unchanged();
						}

						case DecompressionOutcome::NotJavascript:
						case DecompressionOutcome::NoGzipSignature:
						default:
						break;
					}
				}

				return m_rewriter.Rewrite(response, std::move(body), stubRemoved, decompressed, ResolveUrl(resolveUrl));
			}

			std::string RedirectRepairPipeline::ResolveUrl(const util::cb::UrlResolveFunction& resolveUrl) const
			{
				if (!resolveUrl)
				{
					return std::string();
				}

				try
				{
					return resolveUrl();
				}
				catch (std::exception& e)
				{
					std::string errMessage(u8"In RedirectRepairPipeline::ResolveUrl(...) - Failed to resolve request URL: ");
					errMessage.append(e.what());
					ReportError(errMessage);
				}

				return std::string();
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
