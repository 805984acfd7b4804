/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_Pagination_hpp
#define skiff_registry_Pagination_hpp

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <pplx/pplxtasks.h>

#include "registry/RequestPipeline.hpp"


namespace skiff {
namespace registry {

/**
 * Where the next page of a listing starts. Opaque to callers.
 */
class Continuation {
public:
    Continuation() = default;
    explicit Continuation(std::string pathAndQuery)
        : pathAndQuery{std::move(pathAndQuery)}
    {}
    const std::string& getPathAndQuery() const { return pathAndQuery; }

private:
    std::string pathAndQuery;
};

template<typename T>
struct Page {
    std::vector<T> items;
    boost::optional<Continuation> next;
};

/**
 * Target of the link with relation "next" in a Link header, e.g.
 *
 *     </v2/_catalog?last=b&n=2>; rel="next"
 *
 * reduced to path and query, so that the next request stays on the registry endpoint.
 * Relative targets are resolved against the path of the request that returned the header.
 */
boost::optional<Continuation> parseLinkHeader(const std::string& header,
                                              const std::string& requestPathAndQuery = "/");

/**
 * Issues the requests of a tag or catalog listing.
 */
class PaginationCursor {
public:
    enum class Listing { Tags, Catalog };

public:
    PaginationCursor(std::shared_ptr<const RequestPipeline> pipeline,
                     Listing listing,
                     const std::string& repository,
                     const boost::optional<size_t>& pageSize);

    pplx::task<Page<std::string>> fetchFirst() const;
    pplx::task<Page<std::string>> fetchNext(const Continuation& continuation) const;

    std::string getFirstPathAndQuery() const;

private:
    pplx::task<Page<std::string>> fetch(const std::string& pathAndQuery) const;
    RegistryRequest makeRequest(const std::string& pathAndQuery) const;

private:
    std::shared_ptr<const RequestPipeline> pipeline;
    Listing listing;
    std::string repository;
    boost::optional<size_t> pageSize;
};

// Throws RegistryError(RegistryRejected) if the body is not a listing document
std::vector<std::string> parseListing(PaginationCursor::Listing listing, const std::string& body,
                                      const ErrorContext& context);

/**
 * Lazy forward-only sequence of pages. No request is issued before the first
 * call to nextPage. Pages must be requested one at a time.
 */
class PageStream : public std::enable_shared_from_this<PageStream> {
public:
    explicit PageStream(const PaginationCursor& cursor);

    // Yields an empty optional once the page without "next" link was returned
    pplx::task<boost::optional<Page<std::string>>> nextPage();
    // Items of all remaining pages, in order
    pplx::task<std::vector<std::string>> collectAll();

    bool isFinished() const { return finished; }
    size_t getNumberOfPagesFetched() const { return numberOfPagesFetched; }

private:
    PaginationCursor cursor;
    boost::optional<Continuation> next;
    bool finished = false;
    size_t numberOfPagesFetched = 0;
};

}
}

#endif
