/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include "RepairOptions.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{
			namespace options
			{

				const size_t RepairOptions::DefaultCandidateBodyThreshold;

				RepairOptions::RepairOptions() : m_candidateBodyThreshold(DefaultCandidateBodyThreshold)
				{
					// Must initialize all atomic bools explicitly.
					std::fill(m_options.begin(), m_options.end(), true);
				}

				RepairOptions::~RepairOptions()
				{

				}

				bool RepairOptions::GetIsOptionEnabled(const RepairOption option) const
				{
					if (static_cast<uint32_t>(option) >= m_options.size())
					{
						return false;
					}

					return m_options[static_cast<uint32_t>(option)];
				}

				void RepairOptions::SetIsOptionEnabled(const RepairOption option, const bool value)
				{
					if (static_cast<uint32_t>(option) >= m_options.size())
					{
						return;
					}

					m_options[static_cast<uint32_t>(option)] = value;
				}

				size_t RepairOptions::GetCandidateBodyThreshold() const
				{
					return m_candidateBodyThreshold;
				}

				void RepairOptions::SetCandidateBodyThreshold(const size_t threshold)
				{
					m_candidateBodyThreshold = threshold;
				}

			} /* namespace options */
		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
