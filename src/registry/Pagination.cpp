/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/Pagination.hpp"

#include <utility>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libskiff/Logger.hpp"
#include "registry/Reference.hpp"


namespace skiff {
namespace registry {

static const size_t maxListingSize = 16 * 1024 * 1024;

static std::string resolveTarget(const std::string& url, const std::string& requestPathAndQuery) {
    auto schemeEnd = url.find("://");
    if(schemeEnd == std::string::npos) {
        if(!url.empty() && url.front() == '/') {
            return url;
        }
        // relative reference, resolved against the directory of the request path
        auto requestPath = requestPathAndQuery.substr(0, requestPathAndQuery.find('?'));
        auto directoryEnd = requestPath.rfind('/');
        auto directory = directoryEnd == std::string::npos ? std::string{"/"} : requestPath.substr(0, directoryEnd + 1);
        return directory + url;
    }
    auto pathStart = url.find('/', schemeEnd + 3);
    if(pathStart == std::string::npos) {
        return "/";
    }
    return url.substr(pathStart);
}

static bool isNextRelation(const std::string& parameter) {
    auto keyValue = std::vector<std::string>{};
    boost::split(keyValue, parameter, boost::is_any_of("="));
    if(keyValue.size() != 2 || !boost::iequals(boost::trim_copy(keyValue[0]), "rel")) {
        return false;
    }
    auto value = boost::trim_copy_if(boost::trim_copy(keyValue[1]), boost::is_any_of("\""));
    auto relations = std::vector<std::string>{};
    boost::split(relations, value, boost::is_any_of(" "), boost::token_compress_on);
    for(const auto& relation : relations) {
        if(boost::iequals(relation, "next")) {
            return true;
        }
    }
    return false;
}

boost::optional<Continuation> parseLinkHeader(const std::string& header, const std::string& requestPathAndQuery) {
    size_t position = 0;
    while(true) {
        auto urlBegin = header.find('<', position);
        if(urlBegin == std::string::npos) {
            return boost::none;
        }
        auto urlEnd = header.find('>', urlBegin);
        if(urlEnd == std::string::npos) {
            return boost::none;
        }
        auto url = header.substr(urlBegin + 1, urlEnd - urlBegin - 1);

        // parameters run until the next link
        auto parametersEnd = header.find('<', urlEnd);
        auto parametersString = header.substr(urlEnd + 1,
            parametersEnd == std::string::npos ? std::string::npos : parametersEnd - urlEnd - 1);
        auto parameters = std::vector<std::string>{};
        boost::split(parameters, parametersString, boost::is_any_of(";,"));
        for(const auto& parameter : parameters) {
            if(isNextRelation(parameter)) {
                return Continuation{resolveTarget(boost::trim_copy(url), requestPathAndQuery)};
            }
        }

        if(parametersEnd == std::string::npos) {
            return boost::none;
        }
        position = parametersEnd;
    }
}

PaginationCursor::PaginationCursor(std::shared_ptr<const RequestPipeline> pipeline,
                                   Listing listing,
                                   const std::string& repository,
                                   const boost::optional<size_t>& pageSize)
    : pipeline{std::move(pipeline)}
    , listing{listing}
    , repository{repository}
    , pageSize{pageSize}
{
    if(listing == Listing::Tags) {
        validateRepositoryName(repository);
    }
}

std::string PaginationCursor::getFirstPathAndQuery() const {
    auto path = listing == Listing::Tags
        ? "/v2/" + repository + "/tags/list"
        : std::string{"/v2/_catalog"};
    if(pageSize) {
        path += "?n=" + std::to_string(*pageSize);
    }
    return path;
}

pplx::task<Page<std::string>> PaginationCursor::fetchFirst() const {
    return fetch(getFirstPathAndQuery());
}

pplx::task<Page<std::string>> PaginationCursor::fetchNext(const Continuation& continuation) const {
    return fetch(continuation.getPathAndQuery());
}

RegistryRequest PaginationCursor::makeRequest(const std::string& pathAndQuery) const {
    if(listing == Listing::Tags) {
        return RegistryRequest::makeTagList(repository, pathAndQuery);
    }
    return RegistryRequest::makeCatalog(pathAndQuery);
}

pplx::task<Page<std::string>> PaginationCursor::fetch(const std::string& pathAndQuery) const {
    auto request = makeRequest(pathAndQuery);
    auto listing = this->listing;

    return pipeline->execute(request).then([request, listing](HttpResponse response) {
        auto link = response.getHeader("Link");
        auto status = response.status;
        return readBody(response.body, maxListingSize).then([request, listing, link, status](pplx::task<std::string> bodyTask) {
            auto context = request.makeErrorContext();
            context.httpStatus = status;

            auto body = std::string{};
            try {
                body = bodyTask.get();
            }
            catch(const std::exception& e) {
                auto message = boost::format("Failed to read listing %s: %s") % request.pathAndQuery % e.what();
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::TransportError, context, message.str());
            }

            auto page = Page<std::string>{};
            page.items = parseListing(listing, body, context);
            if(link) {
                page.next = parseLinkHeader(*link, request.pathAndQuery);
            }

            libskiff::Logger::getInstance().log(
                boost::format("Fetched %s: %d items, %s")
                    % request.pathAndQuery
                    % page.items.size()
                    % (page.next ? "next " + page.next->getPathAndQuery() : std::string{"last page"}),
                "Pagination", libskiff::LogLevel::DEBUG);

            return page;
        });
    });
}

std::vector<std::string> parseListing(PaginationCursor::Listing listing, const std::string& body,
                                      const ErrorContext& context) {
    auto member = listing == PaginationCursor::Listing::Tags ? "tags" : "repositories";

    auto json = rapidjson::Document{};
    json.Parse(body.c_str(), body.size());
    if(json.HasParseError() || !json.IsObject()) {
        auto message = boost::format("Registry returned a listing that is not a JSON object");
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::RegistryRejected, context, message.str());
    }

    auto items = std::vector<std::string>{};
    auto it = json.FindMember(member);
    if(it == json.MemberEnd() || it->value.IsNull()) {
        // registries send "tags": null for repositories without tags
        return items;
    }
    if(!it->value.IsArray()) {
        auto message = boost::format("Registry returned a listing whose '%s' member is not an array") % member;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::RegistryRejected, context, message.str());
    }
    for(const auto& item : it->value.GetArray()) {
        if(!item.IsString()) {
            auto message = boost::format("Registry returned a listing with a non-string entry in '%s'") % member;
            SKIFF_THROW_REGISTRY_ERROR(ErrorKind::RegistryRejected, context, message.str());
        }
        items.emplace_back(item.GetString(), item.GetStringLength());
    }
    return items;
}

PageStream::PageStream(const PaginationCursor& cursor)
    : cursor{cursor}
{}

pplx::task<boost::optional<Page<std::string>>> PageStream::nextPage() {
    if(finished) {
        return pplx::task_from_result(boost::optional<Page<std::string>>{});
    }

    // a failed first page leaves "next" empty, so retrying fetches it again
    auto self = shared_from_this();
    auto request = next ? cursor.fetchNext(*next) : cursor.fetchFirst();

    return request.then([self](Page<std::string> page) {
        ++self->numberOfPagesFetched;
        self->next = page.next;
        self->finished = !page.next;
        return boost::optional<Page<std::string>>{std::move(page)};
    });
}

static pplx::task<void> collectRemaining(std::shared_ptr<PageStream> stream,
                                         std::shared_ptr<std::vector<std::string>> items) {
    return stream->nextPage().then([stream, items](boost::optional<Page<std::string>> page) {
        if(!page) {
            return pplx::task_from_result();
        }
        items->insert(items->end(), page->items.cbegin(), page->items.cend());
        return collectRemaining(stream, items);
    });
}

pplx::task<std::vector<std::string>> PageStream::collectAll() {
    auto items = std::make_shared<std::vector<std::string>>();
    return collectRemaining(shared_from_this(), items).then([items]() {
        return std::move(*items);
    });
}

}
}
