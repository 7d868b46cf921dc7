/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <algorithm>
#include "RepairOption.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{
			namespace options
			{
				/// <summary>
				/// Storage for the runtime options of the repair engine. All options are simple
				/// values held in atomics, so the embedding application may change them at any
				/// time, from any thread, while messages are being processed. A message already
				/// in flight may see either the old or the new value of an option, but it reads
				/// each option only once.
				///
				/// Loading and storing these values is the job of the embedding application.
				/// </summary>
				class RepairOptions
				{

				public:

					/// <summary>
					/// Default size, in bytes, a redirect body must exceed before the redirect is
					/// considered to be carrying a misplaced payload.
					/// </summary>
					static const size_t DefaultCandidateBodyThreshold = 1000;

					/// <summary>
					/// Default constructor. Every RepairOption starts out enabled and the
					/// candidate threshold is DefaultCandidateBodyThreshold.
					/// </summary>
					RepairOptions();

					/// <summary>
					/// No copy no move no thx.
					/// </summary>
					RepairOptions(const RepairOptions&) = delete;
					RepairOptions(RepairOptions&&) = delete;
					RepairOptions& operator=(const RepairOptions&) = delete;

					~RepairOptions();

					/// <summary>
					/// Check if the specified option is enabled.
					/// </summary>
					/// <param name="option">
					/// The option to query.
					/// </param>
					/// <returns>
					/// True if the option is enabled, false otherwise. Out of range options are
					/// always reported as disabled.
					/// </returns>
					bool GetIsOptionEnabled(const RepairOption option) const;

					/// <summary>
					/// Set if the specified option is enabled or not. Out of range options are
					/// ignored.
					/// </summary>
					/// <param name="option">
					/// The option to modify.
					/// </param>
					/// <param name="value">
					/// The value to be set for the supplied option.
					/// </param>
					void SetIsOptionEnabled(const RepairOption option, const bool value);

					/// <summary>
					/// Gets the number of body bytes a 3xx response must exceed to become a
					/// repair candidate.
					/// </summary>
					size_t GetCandidateBodyThreshold() const;

					void SetCandidateBodyThreshold(const size_t threshold);

				private:

					std::array<std::atomic_bool, static_cast<size_t>(RepairOption::NUMBER_OF_ENTRIES)> m_options;

					std::atomic<size_t> m_candidateBodyThreshold;

				};

			} /* namespace options */
		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
