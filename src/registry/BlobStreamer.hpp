/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_BlobStreamer_hpp
#define skiff_registry_BlobStreamer_hpp

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <pplx/pplxtasks.h>

#include "libskiff/LogLevel.hpp"
#include "registry/Digest.hpp"
#include "registry/HttpTransport.hpp"
#include "registry/RequestPipeline.hpp"


namespace skiff {
namespace registry {

/**
 * Single-pass sequence of the chunks of a blob.
 *
 * Every chunk is hashed before being handed out. The end of the sequence
 * (readChunk yielding an empty optional) is only reported once size and
 * digest were verified; otherwise the final read fails with TruncatedBlob or
 * DigestMismatch and the chunks already consumed must be discarded.
 * Chunks must be read one at a time.
 */
class BlobStream : public std::enable_shared_from_this<BlobStream> {
public:
    BlobStream(const std::string& repository, const Digest& digest,
               const boost::optional<uint64_t>& expectedSize,
               std::shared_ptr<BodyStream> body);

    pplx::task<boost::optional<Chunk>> readChunk();

    // Drains the stream into the sink. The task yields the number of verified bytes.
    pplx::task<uint64_t> writeTo(std::ostream& sink);

    const std::string& getRepository() const { return repository; }
    const Digest& getDigest() const { return digest; }
    const boost::optional<uint64_t>& getExpectedSize() const { return expectedSize; }
    uint64_t getBytesRead() const { return accumulator.getByteCount(); }
    bool isFinished() const { return finished; }

private:
    boost::optional<Chunk> processChunk(boost::optional<Chunk> chunk);
    ErrorContext makeErrorContext() const;

private:
    std::string repository;
    Digest digest;
    boost::optional<uint64_t> expectedSize;
    std::shared_ptr<BodyStream> body;
    DigestAccumulator accumulator;
    bool finished = false;
    bool failed = false;
};

class BlobStreamer {
public:
    explicit BlobStreamer(std::shared_ptr<const RequestPipeline> pipeline);

    // expectedSize, when known to the caller, is verified in addition to Content-Length
    pplx::task<std::shared_ptr<BlobStream>> fetch(const std::string& repository, const Digest& digest,
                                                  const boost::optional<uint64_t>& expectedSize = boost::none) const;
    pplx::task<bool> exists(const std::string& repository, const Digest& digest) const;

private:
    static boost::optional<uint64_t> parseContentLength(const HttpResponse& response);
    static void printLog(const boost::format& message, libskiff::LogLevel level);

private:
    std::shared_ptr<const RequestPipeline> pipeline;
};

}
}

#endif
