/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <cstddef>
#include <vector>
#include <boost/utility/string_ref.hpp>
#include "../mitm/http/HttpMessageView.hpp"
#include "../util/cb/EventReporter.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			/// <summary>
			/// Possible results of PayloadDecompressor::TryDecompress(...).
			/// </summary>
			enum class DecompressionOutcome
			{
				/// <summary>
				/// No Content-Type header names the legacy javascript type. Nothing was tried.
				/// </summary>
				NotJavascript,

				/// <summary>
				/// The body holds no GZIP signature. Nothing was tried.
				/// </summary>
				NoGzipSignature,

				/// <summary>
				/// The embedded stream was inflated completely.
				/// </summary>
				Succeeded,

				/// <summary>
				/// The embedded stream is truncated or corrupt.
				/// </summary>
				Failed
			};

			/// <summary>
			/// Finds and inflates the GZIP stream a misconfigured server appends to its redirect
			/// notice. Only responses declaring the legacy javascript content type are touched,
			/// since that's the only case where the payload is known to be a GZIP stream that
			/// the browser would otherwise never get to see decompressed.
			/// </summary>
			class PayloadDecompressor : public util::cb::EventReporter
			{

			public:

				/// <summary>
				/// The GZIP magic number, 0x1f 0x8b.
				/// </summary>
				static const boost::string_ref GzipSignature;

				PayloadDecompressor(
					util::cb::MessageFunction onInfo = nullptr,
					util::cb::MessageFunction onWarning = nullptr,
					util::cb::MessageFunction onError = nullptr
					);

				/// <summary>
				/// Checks the headers for the javascript signal, locates the first GZIP
				/// signature in the body and inflates everything from there to the end of the
				/// body. Bytes ahead of the signature are discarded. Later signatures are
				/// never tried, even if inflating from the first one fails.
				/// </summary>
				/// <param name="headers">
				/// The header lines of the response.
				/// </param>
				/// <param name="body">
				/// The body, normally already carved.
				/// </param>
				/// <param name="decompressed">
				/// Receives the inflated payload. Only written when the outcome is Succeeded.
				/// </param>
				/// <returns>
				/// The outcome. Failed means the caller must not use any part of the attempt.
				/// </returns>
				DecompressionOutcome TryDecompress(
					const mitm::http::HttpHeaderLines& headers,
					const std::vector<char>& body,
					std::vector<char>& decompressed
					) const;

				/// <summary>
				/// Checks if any Content-Type header line contains the legacy javascript media
				/// type, ignoring case.
				/// </summary>
				static const bool IsJavascriptTarget(const mitm::http::HttpHeaderLines& headers);

				/// <summary>
				/// Inflates a complete GZIP stream. Concatenated members are inflated one after
				/// the other. Only zero bytes may follow the final member; anything else after
				/// it fails the stream.
				/// </summary>
				/// <param name="data">
				/// Pointer to the first byte of the stream.
				/// </param>
				/// <param name="length">
				/// Length of the stream in bytes.
				/// </param>
				/// <param name="decompressed">
				/// Receives the inflated data. Left untouched on failure.
				/// </param>
				/// <returns>
				/// True if the stream was inflated completely, its CRC and length verified,
				/// false otherwise.
				/// </returns>
				const bool DecompressGzip(const char* data, const size_t length, std::vector<char>& decompressed) const;

			};

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
