/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <utility>
#include "RedirectRepairEngine.hpp"
#include "mitm/http/HttpMessageBuilder.hpp"
#include "mitm/http/HttpResponseParser.hpp"
#include "repair/RedirectRepairPipeline.hpp"

namespace rr
{
	namespace repairengine
	{

		RedirectRepairEngine::RedirectRepairEngine(
			util::cb::AnnotationFunction onAnnotate,
			util::cb::MessageFunction onAlert,
			util::cb::MessageFunction onInfo,
			util::cb::MessageFunction onWarning,
			util::cb::MessageFunction onError
			)
			:
			util::cb::EventReporter(onInfo, onWarning, onError),
			m_notifier(onAnnotate, onAlert, onInfo, onWarning, onError)
		{
			m_options.reset(new repair::options::RepairOptions());
			m_pipeline.reset(new repair::RedirectRepairPipeline(m_options.get(), onInfo, onWarning, onError));
		}

		RedirectRepairEngine::~RedirectRepairEngine()
		{

		}

		const bool RedirectRepairEngine::ProcessHttpMessage(
			const HostTool tool,
			const bool isRequest,
			std::vector<char>& message,
			const util::cb::UrlResolveFunction& resolveUrl
			) const
		{
			if (isRequest || tool != HostTool::Proxy)
			{
				return false;
			}

			// One parser per message keeps this method free of shared mutable state.
			mitm::http::HttpResponseParser parser(GetOnInfo(), GetOnWarning(), GetOnError());

			if (!parser.Parse(message.data(), message.size()))
			{
				ReportWarning(u8"In RedirectRepairEngine::ProcessHttpMessage(...) - Response could not be parsed, passing it through.");
				return false;
			}

			auto decision = m_pipeline->Process(parser.GetMessage(), resolveUrl);

			if (!decision.IsRewritten())
			{
				return false;
			}

			const auto& response = decision.GetResponse();

			message = mitm::http::BuildHttpMessage(
				response.GetStatusLine(),
				response.GetHeaders(),
				response.GetBody(),
				m_options->GetIsOptionEnabled(repair::options::RepairOption::UpdateContentLength)
				);

			m_notifier.Notify(
				decision.GetNotification(),
				m_options->GetIsOptionEnabled(repair::options::RepairOption::AnnotateHistory),
				m_options->GetIsOptionEnabled(repair::options::RepairOption::IssueAlerts)
				);

			return true;
		}

		repair::RewriteDecision RedirectRepairEngine::Process(const mitm::http::HttpMessageView& response, const util::cb::UrlResolveFunction& resolveUrl) const
		{
			return m_pipeline->Process(response, resolveUrl);
		}

		repair::options::RepairOptions& RedirectRepairEngine::GetOptions()
		{
			return *m_options;
		}

		const repair::options::RepairOptions& RedirectRepairEngine::GetOptions() const
		{
			return *m_options;
		}

	} /* namespace repairengine */
} /* namespace rr */
