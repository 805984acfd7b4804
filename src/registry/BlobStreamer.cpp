/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/BlobStreamer.hpp"

#include <utility>

#include <boost/lexical_cast.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "registry/Reference.hpp"


namespace skiff {
namespace registry {

BlobStream::BlobStream(const std::string& repository, const Digest& digest,
                       const boost::optional<uint64_t>& expectedSize,
                       std::shared_ptr<BodyStream> body)
    : repository{repository}
    , digest{digest}
    , expectedSize{expectedSize}
    , body{std::move(body)}
    , accumulator{digest.getAlgorithm()}
{}

pplx::task<boost::optional<Chunk>> BlobStream::readChunk() {
    if(finished) {
        auto message = boost::format("Attempted to read blob %s past its end") % digest;
        SKIFF_THROW_ERROR(message.str());
    }
    if(failed) {
        auto message = boost::format("Attempted to read blob %s after a failure") % digest;
        SKIFF_THROW_ERROR(message.str());
    }

    if(!body) {
        return pplx::task_from_result(processChunk(boost::none));
    }

    auto self = shared_from_this();
    return body->readChunk().then([self](pplx::task<boost::optional<Chunk>> chunkTask) {
        auto chunk = boost::optional<Chunk>{};
        try {
            chunk = chunkTask.get();
        }
        catch(const std::exception& e) {
            self->failed = true;
            auto message = boost::format("Failed to read blob %s after %d bytes: %s")
                % self->digest % self->getBytesRead() % e.what();
            SKIFF_THROW_REGISTRY_ERROR(ErrorKind::TransportError, self->makeErrorContext(), message.str());
        }
        return self->processChunk(std::move(chunk));
    });
}

boost::optional<Chunk> BlobStream::processChunk(boost::optional<Chunk> chunk) {
    if(chunk) {
        auto total = getBytesRead() + chunk->size();
        if(expectedSize && total > *expectedSize) {
            failed = true;
            auto message = boost::format("Blob %s is larger than the expected %d bytes") % digest % *expectedSize;
            SKIFF_THROW_REGISTRY_ERROR(ErrorKind::TruncatedBlob, makeErrorContext(), message.str());
        }
        accumulator.update(chunk->data(), chunk->size());
        return chunk;
    }

    finished = true;

    if(expectedSize && getBytesRead() != *expectedSize) {
        auto message = boost::format("Blob %s ended after %d bytes, expected %d bytes")
            % digest % getBytesRead() % *expectedSize;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::TruncatedBlob, makeErrorContext(), message.str());
    }

    auto computed = accumulator.finalize();
    if(computed != digest) {
        auto message = boost::format("Digest mismatch for blob %s of repository %s: computed %s")
            % digest % repository % computed;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::DigestMismatch, makeErrorContext(), message.str());
    }

    return boost::none;
}

static pplx::task<void> drainInto(std::shared_ptr<BlobStream> stream, std::ostream* sink) {
    return stream->readChunk().then([stream, sink](boost::optional<Chunk> chunk) {
        if(!chunk) {
            return pplx::task_from_result();
        }
        sink->write(reinterpret_cast<const char*>(chunk->data()), static_cast<std::streamsize>(chunk->size()));
        if(!*sink) {
            auto message = boost::format("Failed to write blob %s to output stream") % stream->getDigest();
            SKIFF_THROW_ERROR(message.str());
        }
        return drainInto(stream, sink);
    });
}

pplx::task<uint64_t> BlobStream::writeTo(std::ostream& sink) {
    auto self = shared_from_this();
    return drainInto(self, &sink).then([self]() {
        return self->getBytesRead();
    });
}

ErrorContext BlobStream::makeErrorContext() const {
    auto context = ErrorContext{};
    context.repository = repository;
    context.reference = digest.string();
    context.httpStatus = 200;
    return context;
}

BlobStreamer::BlobStreamer(std::shared_ptr<const RequestPipeline> pipeline)
    : pipeline{std::move(pipeline)}
{}

pplx::task<std::shared_ptr<BlobStream>> BlobStreamer::fetch(const std::string& repository, const Digest& digest,
                                                            const boost::optional<uint64_t>& expectedSize) const {
    validateRepositoryName(repository);

    printLog(boost::format("Fetching blob %s of repository %s") % digest % repository, libskiff::LogLevel::DEBUG);

    auto request = RegistryRequest::makeBlobGet(repository, digest.string());
    return pipeline->execute(request).then([request, repository, digest, expectedSize](HttpResponse response) {
        auto size = expectedSize;
        auto contentLength = parseContentLength(response);
        if(contentLength) {
            if(size && *size != *contentLength) {
                auto context = request.makeErrorContext();
                context.httpStatus = response.status;
                auto message = boost::format("Registry announced %d bytes for blob %s, expected %d bytes")
                    % *contentLength % digest % *size;
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::TruncatedBlob, context, message.str());
            }
            size = contentLength;
        }
        return std::make_shared<BlobStream>(repository, digest, size, response.body);
    });
}

pplx::task<bool> BlobStreamer::exists(const std::string& repository, const Digest& digest) const {
    validateRepositoryName(repository);

    auto request = RegistryRequest::makeBlobHead(repository, digest.string());
    return pipeline->execute(request).then([](pplx::task<HttpResponse> responseTask) {
        try {
            responseTask.get();
            return true;
        }
        catch(const RegistryError& e) {
            if(e.getKind() == ErrorKind::NotFound) {
                return false;
            }
            throw;
        }
    });
}

boost::optional<uint64_t> BlobStreamer::parseContentLength(const HttpResponse& response) {
    auto header = response.getHeader("Content-Length");
    if(!header) {
        return boost::none;
    }
    try {
        return boost::lexical_cast<uint64_t>(*header);
    }
    catch(const boost::bad_lexical_cast&) {
        printLog(boost::format("Ignoring invalid Content-Length header '%s'") % *header, libskiff::LogLevel::WARN);
        return boost::none;
    }
}

void BlobStreamer::printLog(const boost::format& message, libskiff::LogLevel level) {
    libskiff::Logger::getInstance().log(message, "BlobStreamer", level);
}

}
}
