/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/HttpTransport.hpp"

#include <utility>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>

#include "libskiff/Error.hpp"


namespace skiff {
namespace registry {

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return boost::algorithm::ilexicographical_compare(lhs, rhs);
}

boost::optional<std::string> HttpResponse::getHeader(const std::string& name) const {
    auto it = headers.find(name);
    if(it == headers.cend()) {
        return boost::none;
    }
    return it->second;
}

static pplx::task<void> readRemainingBody(std::shared_ptr<BodyStream> body,
                                          std::shared_ptr<std::string> buffer,
                                          size_t maxSize) {
    return body->readChunk().then([body, buffer, maxSize](boost::optional<Chunk> chunk) {
        if(!chunk) {
            return pplx::task_from_result();
        }
        if(buffer->size() + chunk->size() > maxSize) {
            auto message = boost::format("HTTP response body exceeds the maximum expected size of %d bytes") % maxSize;
            SKIFF_THROW_ERROR(message.str());
        }
        buffer->append(chunk->cbegin(), chunk->cend());
        return readRemainingBody(body, buffer, maxSize);
    });
}

pplx::task<std::string> readBody(std::shared_ptr<BodyStream> body, size_t maxSize) {
    if(!body) {
        return pplx::task_from_result(std::string{});
    }
    auto buffer = std::make_shared<std::string>();
    return readRemainingBody(body, buffer, maxSize).then([buffer]() {
        return std::move(*buffer);
    });
}

}
}
