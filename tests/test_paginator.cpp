//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_paginator.cpp
// Purpose: Tests for page iteration, truncation, resume tokens and result aggregation
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <map>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "cloudcall/Paginator.h"
#include "cloudcall/errors/Errors.h"

using namespace cloudcall;
using boost::asio::awaitable;

namespace {

template <typename T>
T runAwaitable(boost::asio::io_context& io, awaitable<T> aw) {
    auto fut = boost::asio::co_spawn(io, std::move(aw), boost::asio::use_future);
    io.run();
    io.restart();
    EXPECT_EQ(fut.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    return fut.get();
}

model::PaginatorConfig bucketPaging() {
    model::PaginatorConfig cfg;
    cfg.inputTokens = {"ContinuationToken"};
    cfg.outputTokens = {"NextToken"};
    cfg.resultKeys = {"Buckets"};
    cfg.limitKey = "MaxBuckets";
    cfg.nonAggregateKeys = {"Owner"};
    return cfg;
}

// Serves pages keyed by the ContinuationToken it receives ("" for the first request).
struct FakeBucketService {
    std::map<std::string, std::string> pages;
    std::vector<JSONValue> requests;

    PageFetcher Fetcher() {
        return [this](JSONValue params, std::stop_token) -> awaitable<JSONValue> {
            requests.push_back(params);
            const std::string token = GetString(params, "ContinuationToken").value_or("");
            co_return ParseJSON(pages.at(token));
        };
    }
};

FakeBucketService threePages() {
    FakeBucketService svc;
    svc.pages[""] = R"({"Buckets": ["a", "b"], "NextToken": "t1", "Owner": {"ID": "me"}})";
    svc.pages["t1"] = R"({"Buckets": ["c", "d"], "NextToken": "t2", "Owner": {"ID": "me"}})";
    svc.pages["t2"] = R"({"Buckets": ["e"], "Owner": {"ID": "me"}})";
    return svc;
}

std::vector<std::string> bucketNames(const JSONValue& page) {
    std::vector<std::string> out;
    const JSONValue* arr = FindMember(page, "Buckets");
    if (!arr || !arr->IsArray()) return out;
    for (const auto& item : std::get<JSONValue::Array>(arr->value)) {
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

awaitable<std::vector<JSONValue>> drain(PageIterator& it) {
    std::vector<JSONValue> pages;
    while (auto page = co_await it.Next()) {
        pages.push_back(*page);
    }
    co_return pages;
}

std::vector<std::string> flatten(const std::vector<JSONValue>& pages) {
    std::vector<std::string> out;
    for (const auto& p : pages) {
        auto names = bucketNames(p);
        out.insert(out.end(), names.begin(), names.end());
    }
    return out;
}

} // namespace

TEST(Paginator, TwoPagesThreeBuckets) {
    FakeBucketService svc;
    svc.pages[""] = R"({"Buckets": ["a", "b"], "NextToken": "t1"})";
    svc.pages["t1"] = R"({"Buckets": ["c"]})";
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    PageIterator it = paginator.Paginate();

    boost::asio::io_context io;
    auto pages = runAwaitable(io, drain(it));
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(flatten(pages), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(it.PagesFetched(), 2u);
    EXPECT_TRUE(it.Done());
    EXPECT_FALSE(it.ResumeToken().has_value());

    ASSERT_EQ(svc.requests.size(), 2u);
    EXPECT_EQ(FindMember(svc.requests[0], "ContinuationToken"), nullptr);
    EXPECT_EQ(GetString(svc.requests[1], "ContinuationToken").value_or(""), "t1");
}

TEST(Paginator, CallerParamsAreForwarded) {
    FakeBucketService svc = threePages();
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    PageIterator it = paginator.Paginate(ParseJSON(R"({"Prefix": "logs/"})"));

    boost::asio::io_context io;
    (void)runAwaitable(io, drain(it));
    ASSERT_EQ(svc.requests.size(), 3u);
    for (const auto& req : svc.requests) {
        EXPECT_EQ(GetString(req, "Prefix").value_or(""), "logs/");
    }
}

TEST(Paginator, MaxItemsTruncatesAndResumes) {
    FakeBucketService svc = threePages();
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");

    PaginationOptions opts;
    opts.maxItems = 3;
    PageIterator first = paginator.Paginate(JSONValue(JSONValue::Object{}), opts);
    boost::asio::io_context io;
    auto pages = runAwaitable(io, drain(first));
    EXPECT_EQ(flatten(pages), (std::vector<std::string>{"a", "b", "c"}));
    ASSERT_TRUE(first.ResumeToken().has_value());

    JSONValue token = ParseJSON(*first.ResumeToken());
    EXPECT_EQ(GetString(token, "ContinuationToken").value_or(""), "t1");
    EXPECT_EQ(*FindMember(token, "truncate_amount"), JSONValue(int64_t{1}));

    PaginationOptions resume;
    resume.startingToken = first.ResumeToken();
    PageIterator second = paginator.Paginate(JSONValue(JSONValue::Object{}), resume);
    auto rest = runAwaitable(io, drain(second));
    EXPECT_EQ(flatten(rest), (std::vector<std::string>{"d", "e"}));
    EXPECT_FALSE(second.ResumeToken().has_value());
}

TEST(Paginator, MaxItemsOnPageBoundaryUsesNextToken) {
    FakeBucketService svc = threePages();
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    PaginationOptions opts;
    opts.maxItems = 4;
    PageIterator it = paginator.Paginate(JSONValue(JSONValue::Object{}), opts);

    boost::asio::io_context io;
    auto pages = runAwaitable(io, drain(it));
    EXPECT_EQ(flatten(pages), (std::vector<std::string>{"a", "b", "c", "d"}));
    ASSERT_TRUE(it.ResumeToken().has_value());
    JSONValue token = ParseJSON(*it.ResumeToken());
    EXPECT_EQ(GetString(token, "ContinuationToken").value_or(""), "t2");
    EXPECT_EQ(FindMember(token, "truncate_amount"), nullptr);
    EXPECT_EQ(svc.requests.size(), 2u);
}

TEST(Paginator, RepeatedTokenFailsAfterYieldingThePage) {
    FakeBucketService svc;
    svc.pages[""] = R"({"Buckets": ["a"], "NextToken": "loop"})";
    svc.pages["loop"] = R"({"Buckets": ["b"], "NextToken": "loop"})";
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    PageIterator it = paginator.Paginate();

    std::vector<std::string> seen;
    bool threw = false;
    auto body = [&]() -> awaitable<void> {
        try {
            while (auto page = co_await it.Next()) {
                auto names = bucketNames(*page);
                seen.insert(seen.end(), names.begin(), names.end());
            }
        } catch (const errors::PaginationError& e) {
            threw = std::string(e.what()).find("The same next token was received twice") != std::string::npos;
        }
    };
    boost::asio::io_context io;
    runAwaitable(io, body());
    EXPECT_TRUE(threw);
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(svc.requests.size(), 2u);
}

TEST(Paginator, MoreResultsFalseStops) {
    FakeBucketService svc;
    svc.pages[""] = R"({"Buckets": ["a"], "NextToken": "t1", "IsTruncated": false})";
    model::PaginatorConfig cfg = bucketPaging();
    cfg.moreResults = "IsTruncated";
    Paginator paginator(svc.Fetcher(), cfg, "ListBuckets");
    PageIterator it = paginator.Paginate();

    boost::asio::io_context io;
    auto pages = runAwaitable(io, drain(it));
    EXPECT_EQ(pages.size(), 1u);
    EXPECT_EQ(svc.requests.size(), 1u);
}

TEST(Paginator, EmptyTokenEndsIteration) {
    FakeBucketService svc;
    svc.pages[""] = R"({"Buckets": ["a"], "NextToken": ""})";
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    PageIterator it = paginator.Paginate();
    boost::asio::io_context io;
    auto pages = runAwaitable(io, drain(it));
    EXPECT_EQ(pages.size(), 1u);
}

TEST(Paginator, PageSizeWritesLimitKey) {
    FakeBucketService svc = threePages();
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    PaginationOptions opts;
    opts.pageSize = 2;
    PageIterator it = paginator.Paginate(JSONValue(JSONValue::Object{}), opts);
    boost::asio::io_context io;
    (void)runAwaitable(io, drain(it));
    for (const auto& req : svc.requests) {
        EXPECT_EQ(*FindMember(req, "MaxBuckets"), JSONValue(int64_t{2}));
    }

    model::PaginatorConfig noLimit = bucketPaging();
    noLimit.limitKey.reset();
    Paginator unlimited(svc.Fetcher(), noLimit, "ListBuckets");
    EXPECT_THROW((void)unlimited.Paginate(JSONValue(JSONValue::Object{}), opts), errors::PaginationError);
}

TEST(Paginator, InvalidStartingToken) {
    FakeBucketService svc = threePages();
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    PaginationOptions opts;
    opts.startingToken = "not-a-token";
    EXPECT_THROW((void)paginator.Paginate(JSONValue(JSONValue::Object{}), opts), errors::PaginationError);
}

TEST(Paginator, BuildFullResultMergesPages) {
    FakeBucketService svc = threePages();
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    PageIterator it = paginator.Paginate();
    boost::asio::io_context io;
    JSONValue full = runAwaitable(io, it.BuildFullResult());
    EXPECT_EQ(bucketNames(full), (std::vector<std::string>{"a", "b", "c", "d", "e"}));
    EXPECT_EQ(GetString(*FindMember(full, "Owner"), "ID").value_or(""), "me");
    EXPECT_EQ(FindMember(full, "NextToken"), nullptr);
}

TEST(Paginator, BuildFullResultCarriesResumeToken) {
    FakeBucketService svc = threePages();
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    PaginationOptions opts;
    opts.maxItems = 3;
    PageIterator it = paginator.Paginate(JSONValue(JSONValue::Object{}), opts);
    boost::asio::io_context io;
    JSONValue full = runAwaitable(io, it.BuildFullResult());
    EXPECT_EQ(bucketNames(full), (std::vector<std::string>{"a", "b", "c"}));
    ASSERT_TRUE(it.ResumeToken().has_value());
    EXPECT_EQ(GetString(full, "NextToken").value_or(""), *it.ResumeToken());
}

TEST(Paginator, RepeatedResumesYieldEveryItemOnce) {
    FakeBucketService svc;
    svc.pages[""] = R"({"Buckets": ["a", "b", "c"], "NextToken": "t1"})";
    svc.pages["t1"] = R"({"Buckets": ["d", "e", "f"], "NextToken": "t2"})";
    svc.pages["t2"] = R"({"Buckets": ["g", "h", "i"]})";
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");
    boost::asio::io_context io;

    PaginationOptions first;
    first.maxItems = 2;
    PageIterator run1 = paginator.Paginate(JSONValue(JSONValue::Object{}), first);
    std::vector<std::string> all = flatten(runAwaitable(io, drain(run1)));
    ASSERT_TRUE(run1.ResumeToken().has_value());

    PaginationOptions second;
    second.maxItems = 5;
    second.startingToken = run1.ResumeToken();
    PageIterator run2 = paginator.Paginate(JSONValue(JSONValue::Object{}), second);
    auto middle = flatten(runAwaitable(io, drain(run2)));
    EXPECT_EQ(middle, (std::vector<std::string>{"c", "d", "e", "f", "g"}));
    all.insert(all.end(), middle.begin(), middle.end());
    ASSERT_TRUE(run2.ResumeToken().has_value());
    JSONValue token = ParseJSON(*run2.ResumeToken());
    EXPECT_EQ(GetString(token, "ContinuationToken").value_or(""), "t2");
    EXPECT_EQ(*FindMember(token, "truncate_amount"), JSONValue(int64_t{1}));

    PaginationOptions third;
    third.startingToken = run2.ResumeToken();
    PageIterator run3 = paginator.Paginate(JSONValue(JSONValue::Object{}), third);
    auto rest = flatten(runAwaitable(io, drain(run3)));
    all.insert(all.end(), rest.begin(), rest.end());
    EXPECT_FALSE(run3.ResumeToken().has_value());

    EXPECT_EQ(all, (std::vector<std::string>{"a", "b", "c", "d", "e", "f", "g", "h", "i"}));
}

TEST(Paginator, NegativeLimitsAreRejected) {
    FakeBucketService svc = threePages();
    Paginator paginator(svc.Fetcher(), bucketPaging(), "ListBuckets");

    PaginationOptions negativeMax;
    negativeMax.maxItems = -1;
    EXPECT_THROW((void)paginator.Paginate(JSONValue(JSONValue::Object{}), negativeMax), errors::PaginationError);

    PaginationOptions negativeTruncation;
    negativeTruncation.startingToken = R"({"ContinuationToken": "t1", "truncate_amount": -2})";
    EXPECT_THROW((void)paginator.Paginate(JSONValue(JSONValue::Object{}), negativeTruncation),
                 errors::PaginationError);
    EXPECT_TRUE(svc.requests.empty());
}
