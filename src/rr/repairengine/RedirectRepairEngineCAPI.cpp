/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <string>
#include <vector>
#include <iostream>
#include <limits>
#include "RedirectRepairEngineCAPI.h"
#include "RedirectRepairEngine.hpp"

namespace
{
	namespace re = rr::repairengine;

	re::util::cb::MessageFunction WrapMessageCallback(ReportMessageCallback cb)
	{
		if (cb == nullptr)
		{
			return nullptr;
		}

		return [cb](const char* message, const size_t messageLength)
		{
			cb(message, static_cast<uint32_t>(messageLength));
		};
	}

	re::RedirectRepairEngine* FromHandle(void* ptr)
	{
		return static_cast<re::RedirectRepairEngine*>(ptr);
	}
}

void* rr_engine_create(
	HistoryAnnotationCallback onAnnotate,
	IssueAlertCallback onAlert,
	ReportMessageCallback onInfo,
	ReportMessageCallback onWarn,
	ReportMessageCallback onError
	)
{
	re::util::cb::AnnotationFunction annotate = nullptr;

	if (onAnnotate != nullptr)
	{
		annotate = [onAnnotate](const char* color, const size_t colorLength, const char* comment, const size_t commentLength)
		{
			onAnnotate(color, static_cast<uint32_t>(colorLength), comment, static_cast<uint32_t>(commentLength));
		};
	}

	void* inst = nullptr;

	try
	{
		inst = static_cast<void*>(new re::RedirectRepairEngine(
			annotate,
			WrapMessageCallback(onAlert),
			WrapMessageCallback(onInfo),
			WrapMessageCallback(onWarn),
			WrapMessageCallback(onError)
			));
	}
	catch (std::exception& e)
	{
		std::cout << "error: " << e.what() << std::endl;
	}

	return inst;
}

void rr_engine_destroy(void** ptr)
{
	if (ptr == nullptr)
	{
		return;
	}

	re::RedirectRepairEngine* cppPtr = FromHandle(*ptr);

	if (cppPtr != nullptr)
	{
		delete cppPtr;
	}

	*ptr = nullptr;
}

bool rr_engine_process_response(
	void* ptr,
	const char* response,
	const uint32_t responseLength,
	const char* url,
	const uint32_t urlLength,
	CustomResponseStreamWriter writer
	)
{
	auto cppPtr = FromHandle(ptr);

	if (cppPtr == nullptr || response == nullptr || responseLength == 0)
	{
		return false;
	}

	std::string requestUrl;

	if (url != nullptr && urlLength > 0)
	{
		requestUrl.assign(url, static_cast<size_t>(urlLength));
	}

	try
	{
		std::vector<char> message(response, response + responseLength);

		auto replaced = cppPtr->ProcessHttpMessage(re::HostTool::Proxy, false, message, [&requestUrl]()
		{
			return requestUrl;
		});

		if (!replaced)
		{
			return false;
		}

		if (message.size() > std::numeric_limits<uint32_t>::max())
		{
			cppPtr->ReportError(u8"In rr_engine_process_response(...) - Rebuilt response is too large to hand back, passing the original through.");
			return false;
		}

		if (writer != nullptr)
		{
			writer(message.data(), static_cast<uint32_t>(message.size()));
		}

		return true;
	}
	catch (std::exception& e)
	{
		std::string errMessage(u8"In rr_engine_process_response(...) - Exception while processing response: ");
		errMessage.append(e.what());
		cppPtr->ReportError(errMessage);
	}

	return false;
}

bool rr_engine_get_option(void* ptr, const uint32_t option)
{
	auto cppPtr = FromHandle(ptr);

	if (cppPtr == nullptr)
	{
		return false;
	}

	return cppPtr->GetOptions().GetIsOptionEnabled(static_cast<re::repair::options::RepairOption>(option));
}

void rr_engine_set_option(void* ptr, const uint32_t option, const bool value)
{
	auto cppPtr = FromHandle(ptr);

	if (cppPtr == nullptr)
	{
		return;
	}

	cppPtr->GetOptions().SetIsOptionEnabled(static_cast<re::repair::options::RepairOption>(option), value);
}

uint32_t rr_engine_get_candidate_threshold(void* ptr)
{
	auto cppPtr = FromHandle(ptr);

	if (cppPtr == nullptr)
	{
		return 0;
	}

	auto threshold = cppPtr->GetOptions().GetCandidateBodyThreshold();

	if (threshold > std::numeric_limits<uint32_t>::max())
	{
		return std::numeric_limits<uint32_t>::max();
	}

	return static_cast<uint32_t>(threshold);
}

void rr_engine_set_candidate_threshold(void* ptr, const uint32_t threshold)
{
	auto cppPtr = FromHandle(ptr);

	if (cppPtr == nullptr)
	{
		return;
	}

	cppPtr->GetOptions().SetCandidateBodyThreshold(static_cast<size_t>(threshold));
}
