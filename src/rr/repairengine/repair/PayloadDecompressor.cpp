/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include <string>
#include <stdexcept>
#include <utility>
#include <ios>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include "PayloadDecompressor.hpp"
#include "../../util/http/KnownHttpHeaders.hpp"
#include "../../util/string/StringRefUtil.hpp"

namespace rr
{
	namespace repairengine
	{
		namespace repair
		{

			const boost::string_ref PayloadDecompressor::GzipSignature{ "\x1f\x8b", 2 };

			PayloadDecompressor::PayloadDecompressor(
				util::cb::MessageFunction onInfo,
				util::cb::MessageFunction onWarning,
				util::cb::MessageFunction onError
				)
				:
				util::cb::EventReporter(onInfo, onWarning, onError)
			{

			}

			DecompressionOutcome PayloadDecompressor::TryDecompress(
				const mitm::http::HttpHeaderLines& headers,
				const std::vector<char>& body,
				std::vector<char>& decompressed
				) const
			{
				if (!IsJavascriptTarget(headers))
				{
					return DecompressionOutcome::NotJavascript;
				}

				auto startIndex = rr::util::string::FindBytes(body, GzipSignature);

				if (startIndex == boost::string_ref::npos)
				{
					ReportWarning(u8"In PayloadDecompressor::TryDecompress(...) - Javascript target carries no GZIP signature, leaving the body as is.");
					return DecompressionOutcome::NoGzipSignature;
				}

				ReportInfo(std::string(u8"In PayloadDecompressor::TryDecompress(...) - Found GZIP data at offset ") + std::to_string(startIndex) + u8", decompressing...");

				if (!DecompressGzip(body.data() + startIndex, body.size() - startIndex, decompressed))
				{
					return DecompressionOutcome::Failed;
				}

				ReportInfo(u8"In PayloadDecompressor::TryDecompress(...) - Response successfully carved and decompressed.");

				return DecompressionOutcome::Succeeded;
			}

			const bool PayloadDecompressor::IsJavascriptTarget(const mitm::http::HttpHeaderLines& headers)
			{
				for (const auto& header : headers)
				{
					if (rr::util::string::IsHeaderNamed(header, rr::util::http::headers::ContentType) &&
						rr::util::string::IContains(header, rr::util::http::values::ContentTypeLegacyJavascript))
					{
						return true;
					}
				}

				return false;
			}

			const bool PayloadDecompressor::DecompressGzip(const char* data, const size_t length, std::vector<char>& decompressed) const
			{
				if (data == nullptr || length == 0)
				{
					ReportError(u8"In PayloadDecompressor::DecompressGzip(...) - There is no payload to decompress.");
					return false;
				}

				std::vector<char> inflated;
				inflated.reserve(length);

				// Zero bytes may pad the stream. The footer itself can end in zeros too, so
				// they're held back here and fed in one at a time below.
				size_t streamLength = length;

				while (streamLength > 0 && data[streamLength - 1] == '\0')
				{
					--streamLength;
				}

				try
				{
					// Written straight through the filter into the sink, no filtering_stream.
					// Closing the filter for output is what verifies the final footer, and it
					// throws on a stream that ends early.
					boost::iostreams::back_insert_device< std::vector<char> > decompressorSnk(inflated);
					boost::iostreams::gzip_decompressor decomp(boost::iostreams::zlib::default_window_bits);
					decomp.write(decompressorSnk, data, static_cast<std::streamsize>(streamLength));

					bool reachedPadding = false;

					for (size_t i = streamLength; i < length && !reachedPadding; ++i)
					{
						try
						{
							decomp.write(decompressorSnk, data + i, 1);
						}
						catch (const boost::iostreams::gzip_error& e)
						{
							if (e.error() != boost::iostreams::gzip::bad_header)
							{
								throw;
							}

							// A zero can only be rejected as the start of a new member once the
							// previous member's footer has been verified and its output written.
							reachedPadding = true;
						}
					}

					if (!reachedPadding)
					{
						decomp.close(decompressorSnk, std::ios_base::out);
					}
				}
				catch (std::exception& e)
				{
					std::string errMessage(u8"In PayloadDecompressor::DecompressGzip(...) - GZIP decompression failed: ");
					errMessage.append(e.what());
					ReportError(errMessage);
					return false;
				}

				// Zero bytes of output is legal. An empty payload compresses to a valid,
				// non-empty stream.
				decompressed = std::move(inflated);
				return true;
			}

		} /* namespace repair */
	} /* namespace repairengine */
} /* namespace rr */
