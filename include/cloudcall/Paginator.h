//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Paginator.h
// Purpose: Lazy, suspend-capable iteration over paged operations
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "cloudcall/JSONValue.h"
#include "cloudcall/model/ServiceModel.h"

namespace cloudcall {

// Performs one full call for a page. Bound explicitly per paginator.
using PageFetcher = std::function<boost::asio::awaitable<JSONValue>(const JSONValue& params, std::stop_token stop)>;

//==========================================================================================================
// PaginationOptions
// Fields:
//   maxItems: Total result items to yield across pages; the last page is truncated to fit.
//   pageSize: Written into the operation's limit key.
//   startingToken: A ResumeToken() from an earlier iteration.
//==========================================================================================================
struct PaginationOptions {
    std::optional<int64_t> maxItems;
    std::optional<int64_t> pageSize;
    std::optional<std::string> startingToken;
};

//==========================================================================================================
// PageIterator
// Purpose: Single-use page sequence. Each Next() performs one call with the previous page's
//          continuation token(s). The iterator must outlive any pending Next().
//==========================================================================================================
class PageIterator {
public:
    PageIterator(PageFetcher fetcher,
                 model::PaginatorConfig config,
                 std::string operationName,
                 JSONValue params,
                 PaginationOptions options,
                 std::stop_token stop);

    //==========================================================================================================
    // Next
    // Returns:
    //   The next parsed page, or std::nullopt once the sequence is exhausted.
    // Throws:
    //   errors::PaginationError when the service returned the same token twice in a row.
    //   Any error raised by the underlying call.
    //==========================================================================================================
    boost::asio::awaitable<std::optional<JSONValue>> Next();

    // Token to continue a truncated iteration; set once maxItems cut the sequence short.
    const std::optional<std::string>& ResumeToken() const { return resumeToken_; }

    bool Done() const { return done_; }
    std::size_t PagesFetched() const { return pagesFetched_; }

    //==========================================================================================================
    // BuildFullResult
    // Purpose: Drains the iterator and merges every page's result keys into one response. Non-aggregate
    //          keys come from the first page. Carries "NextToken" when the iteration was truncated.
    //==========================================================================================================
    boost::asio::awaitable<JSONValue> BuildFullResult();

private:
    using TokenMap = std::map<std::string, JSONValue>;

    PageFetcher fetcher_;
    model::PaginatorConfig config_;
    std::string operationName_;
    JSONValue params_;
    PaginationOptions options_;
    std::stop_token stop_;

    TokenMap currentToken_;
    std::optional<TokenMap> previousToken_;
    std::optional<std::string> pendingError_;
    std::optional<std::string> resumeToken_;
    int64_t totalItems_{0};
    int64_t startingTruncation_{0};
    bool firstRequest_{true};
    bool done_{false};
    std::size_t pagesFetched_{0};

    void parseStartingToken();
    void injectToken(const TokenMap& token);
    TokenMap extractNextToken(const JSONValue& page) const;
    void truncatePage(JSONValue& page, int64_t truncateAmount);
    void trimFirstPage(JSONValue& page);
    void setResumeToken(const TokenMap& token, int64_t truncateAmount);
    static std::string encodeToken(const TokenMap& token);
};

//==========================================================================================================
// Paginator
// Purpose: Factory of PageIterator instances for one pageable operation.
//==========================================================================================================
class Paginator {
public:
    Paginator(PageFetcher fetcher, model::PaginatorConfig config, std::string operationName);

    // Fresh iteration state on every call.
    PageIterator Paginate(JSONValue params = JSONValue(JSONValue::Object{}),
                          PaginationOptions options = {},
                          std::stop_token stop = {}) const;

    const model::PaginatorConfig& Config() const { return config_; }
    const std::string& OperationName() const { return operationName_; }

private:
    PageFetcher fetcher_;
    model::PaginatorConfig config_;
    std::string operationName_;
};

} // namespace cloudcall
