/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

/*
* Only the headers and header values that the repair engine actually inspects or rewrites are
* listed here. Names are matched case-insensitively everywhere they are used, so the spelling
* below is only what gets written when we add a header ourselves.
*/

#include <string>

namespace rr
{
	namespace util
	{
		namespace http
		{
			namespace headers
			{

				/// <summary>
				/// Header Name: Content-Encoding
				/// Protocol: HTTP
				/// Status: Standard
				/// Defined In: [RFC7231, Section 3.1.2.2]
				/// </summary>
				const std::string ContentEncoding{ u8"Content-Encoding" };

				/// <summary>
				/// Header Name: Content-Length
				/// Protocol: HTTP
				/// Status: Standard
				/// Defined In: [RFC7230, Section 3.3.2]
				/// </summary>
				const std::string ContentLength{ u8"Content-Length" };

				/// <summary>
				/// Header Name: Content-Type
				/// Protocol: HTTP
				/// Status: Standard
				/// Defined In: [RFC7231, Section 3.1.1.5]
				/// </summary>
				const std::string ContentType{ u8"Content-Type" };

				/// <summary>
				/// Header Name: Transfer-Encoding
				/// Protocol: HTTP
				/// Status: Standard
				/// Defined In: [RFC7230, Section 3.3.1]
				/// </summary>
				const std::string TransferEncoding{ u8"Transfer-Encoding" };

			} /* namespace headers */

			namespace values
			{

				/// <summary>
				/// Legacy javascript media type. The misconfigured servers we repair label the
				/// embedded payload with this type, and only this type triggers decompression.
				/// </summary>
				const std::string ContentTypeLegacyJavascript{ u8"application/x-javascript" };

				/// <summary>
				/// Transfer-Encoding value for chunked payloads.
				/// </summary>
				const std::string TransferEncodingChunked{ u8"chunked" };

			} /* namespace values */
		} /* namespace http */
	} /* namespace util */
} /* namespace rr */
