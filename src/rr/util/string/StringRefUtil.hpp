/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/


#pragma once

#include <algorithm>
#include <cctype>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/utility/string_ref.hpp>

namespace rr
{
	namespace util
	{
		namespace string
		{

			/// <summary>
			/// Checks if the supplied string contains the supplied substring, ignoring case.
			/// </summary>
			/// <param name="what">
			/// The string to search.
			/// </param>
			/// <param name="needle">
			/// The substring to search for.
			/// </param>
			/// <returns>
			/// True if the needle was found anywhere within what, false otherwise.
			/// </returns>
			inline bool IContains(boost::string_ref what, boost::string_ref needle)
			{
				auto result = boost::algorithm::ifind_first(what, needle);
				return !result.empty();
			}

			/// <summary>
			/// Splits the supplied string_ref on runs of spaces and tabs, discarding empty
			/// tokens. Leading and trailing whitespace produce no tokens.
			/// </summary>
			/// <param name="what">
			/// The string_ref to split.
			/// </param>
			/// <returns>
			/// The non-empty tokens, in order. These point into the memory of what.
			/// </returns>
			inline std::vector<boost::string_ref> SplitWhitespace(boost::string_ref what)
			{
				std::vector<boost::string_ref> ret;

				size_t i = 0;
				while (i < what.size())
				{
					while (i < what.size() && (what[i] == ' ' || what[i] == '\t'))
					{
						++i;
					}

					auto start = i;

					while (i < what.size() && what[i] != ' ' && what[i] != '\t')
					{
						++i;
					}

					if (i > start)
					{
						ret.push_back(what.substr(start, i - start));
					}
				}

				return ret;
			}

			/// <summary>
			/// Extracts the field name from a raw "Name: value" header line. Surrounding
			/// whitespace is trimmed from the name.
			/// </summary>
			/// <param name="headerLine">
			/// The raw header line.
			/// </param>
			/// <returns>
			/// The header name, or an empty string_ref if the line carries no colon.
			/// </returns>
			inline boost::string_ref HeaderName(boost::string_ref headerLine)
			{
				auto colon = headerLine.find(':');

				if (colon == boost::string_ref::npos)
				{
					return boost::string_ref();
				}

				auto name = headerLine.substr(0, colon);

				while (!name.empty() && std::isspace(static_cast<unsigned char>(name.front())))
				{
					name.remove_prefix(1);
				}

				while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back())))
				{
					name.remove_suffix(1);
				}

				return name;
			}

			/// <summary>
			/// Checks whether the raw header line declares the supplied header name, ignoring
			/// case.
			/// </summary>
			inline bool IsHeaderNamed(boost::string_ref headerLine, boost::string_ref name)
			{
				auto lineName = HeaderName(headerLine);

				if (lineName.empty())
				{
					return false;
				}

				return boost::algorithm::iequals(lineName, name);
			}

			/// <summary>
			/// Finds the first occurrence of the needle bytes in the haystack, starting at the
			/// supplied offset. Binary safe.
			/// </summary>
			/// <returns>
			/// The offset of the first match, or boost::string_ref::npos if there is none.
			/// </returns>
			inline size_t FindBytes(const std::vector<char>& haystack, boost::string_ref needle, const size_t from = 0)
			{
				if (from > haystack.size() || needle.empty())
				{
					return boost::string_ref::npos;
				}

				auto it = std::search(haystack.begin() + from, haystack.end(), needle.begin(), needle.end());

				if (it == haystack.end())
				{
					return boost::string_ref::npos;
				}

				return static_cast<size_t>(it - haystack.begin());
			}

		} /* namespace string */
	} /* namespace util */
} /* namespace rr */
