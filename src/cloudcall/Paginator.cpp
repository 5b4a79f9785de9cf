//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Paginator.cpp
// Purpose: Page iteration, truncation and resume tokens
//==========================================================================================================

#include "cloudcall/Paginator.h"

#include <algorithm>
#include <stdexcept>

#include "cloudcall/errors/Errors.h"
#include "logging/Logger.h"

namespace cloudcall {

namespace {

constexpr const char* kTruncateAmountKey = "truncate_amount";

bool isTruthyToken(const JSONValue& v) {
    if (v.IsNull()) return false;
    if (v.IsString()) return !std::get<std::string>(v.value).empty();
    return true;
}

std::size_t arraySize(const JSONValue* v) {
    if (!v || !v->IsArray()) return 0;
    return std::get<JSONValue::Array>(v->value).size();
}

} // namespace

PageIterator::PageIterator(PageFetcher fetcher,
                           model::PaginatorConfig config,
                           std::string operationName,
                           JSONValue params,
                           PaginationOptions options,
                           std::stop_token stop)
    : fetcher_(std::move(fetcher)),
      config_(std::move(config)),
      operationName_(std::move(operationName)),
      params_(params.IsNull() ? JSONValue(JSONValue::Object{}) : std::move(params)),
      options_(std::move(options)),
      stop_(std::move(stop)) {
    if (options_.maxItems.has_value() && *options_.maxItems < 0) {
        throw errors::PaginationError("MaxItems must not be negative: " + std::to_string(*options_.maxItems));
    }
    if (options_.pageSize.has_value()) {
        if (!config_.limitKey.has_value()) {
            throw errors::PaginationError("PageSize is not supported for " + operationName_);
        }
        SetPath(params_, *config_.limitKey, JSONValue(*options_.pageSize));
    }
    if (options_.startingToken.has_value()) {
        parseStartingToken();
        injectToken(currentToken_);
    }
}

void PageIterator::parseStartingToken() {
    JSONValue decoded;
    try {
        decoded = ParseJSON(*options_.startingToken);
    } catch (const std::runtime_error& e) {
        throw errors::PaginationError("invalid starting token: " + std::string(e.what()));
    }
    if (!decoded.IsObject()) {
        throw errors::PaginationError("invalid starting token: expected an object");
    }
    for (const auto& [key, value] : std::get<JSONValue::Object>(decoded.value)) {
        if (!value) continue;
        if (key == kTruncateAmountKey) {
            if (!std::holds_alternative<int64_t>(value->value)) {
                throw errors::PaginationError("invalid starting token: truncate amount must be an integer");
            }
            startingTruncation_ = std::get<int64_t>(value->value);
            if (startingTruncation_ < 0) {
                throw errors::PaginationError("invalid starting token: truncate amount must not be negative");
            }
            continue;
        }
        currentToken_.emplace(key, *value);
    }
}

void PageIterator::injectToken(const TokenMap& token) {
    for (const auto& inputKey : config_.inputTokens) {
        auto it = token.find(inputKey);
        if (it != token.end()) {
            SetPath(params_, inputKey, it->second);
        } else if (params_.IsObject()) {
            std::get<JSONValue::Object>(params_.value).erase(inputKey);
        }
    }
}

PageIterator::TokenMap PageIterator::extractNextToken(const JSONValue& page) const {
    TokenMap next;
    if (config_.moreResults.has_value()) {
        const JSONValue* more = FindPath(page, *config_.moreResults);
        if (!more || !std::holds_alternative<bool>(more->value) || !std::get<bool>(more->value)) {
            return next;
        }
    }
    for (std::size_t i = 0; i < config_.outputTokens.size() && i < config_.inputTokens.size(); ++i) {
        const JSONValue* token = FindPath(page, config_.outputTokens[i]);
        if (token && isTruthyToken(*token)) {
            next.emplace(config_.inputTokens[i], *token);
        }
    }
    return next;
}

std::string PageIterator::encodeToken(const TokenMap& token) {
    JSONValue out(JSONValue::Object{});
    for (const auto& [k, v] : token) {
        SetMember(out, k, v);
    }
    return SerializeJSON(out);
}

void PageIterator::setResumeToken(const TokenMap& token, int64_t truncateAmount) {
    TokenMap withAmount = token;
    if (truncateAmount > 0) {
        withAmount[kTruncateAmountKey] = JSONValue(truncateAmount);
    }
    resumeToken_ = encodeToken(withAmount);
}

// Empties secondary result keys and keeps the head of the primary one.
void PageIterator::truncatePage(JSONValue& page, int64_t truncateAmount) {
    const std::string& primary = config_.resultKeys.front();
    const JSONValue* original = FindPath(page, primary);
    const auto size = static_cast<int64_t>(arraySize(original));
    const int64_t keep = size - truncateAmount;
    JSONValue::Array head;
    if (original && original->IsArray()) {
        const auto& arr = std::get<JSONValue::Array>(original->value);
        head.assign(arr.begin(), arr.begin() + static_cast<std::ptrdiff_t>(keep));
    }
    SetPath(page, primary, JSONValue(std::move(head)));
    for (std::size_t i = 1; i < config_.resultKeys.size(); ++i) {
        if (FindPath(page, config_.resultKeys[i])) {
            SetPath(page, config_.resultKeys[i], JSONValue(JSONValue::Array{}));
        }
    }
    setResumeToken(currentToken_, keep + startingTruncation_);
    LOG_DEBUG("{}: truncated page to {} items (maxItems reached)", operationName_, keep);
}

// Drops the items an earlier, truncated iteration already yielded.
void PageIterator::trimFirstPage(JSONValue& page) {
    const std::string& primary = config_.resultKeys.front();
    const JSONValue* original = FindPath(page, primary);
    if (!original || !original->IsArray()) {
        return;
    }
    const auto& arr = std::get<JSONValue::Array>(original->value);
    const std::size_t skip = std::min(arr.size(), static_cast<std::size_t>(startingTruncation_));
    JSONValue::Array tail(arr.begin() + static_cast<std::ptrdiff_t>(skip), arr.end());
    SetPath(page, primary, JSONValue(std::move(tail)));
    for (std::size_t i = 1; i < config_.resultKeys.size(); ++i) {
        const JSONValue* other = FindPath(page, config_.resultKeys[i]);
        if (other && other->IsArray()) {
            SetPath(page, config_.resultKeys[i], JSONValue(JSONValue::Array{}));
        }
    }
}

boost::asio::awaitable<std::optional<JSONValue>> PageIterator::Next() {
    if (pendingError_.has_value()) {
        done_ = true;
        std::string message = *pendingError_;
        pendingError_.reset();
        throw errors::PaginationError(message);
    }
    if (done_) {
        co_return std::nullopt;
    }

    JSONValue page = co_await fetcher_(params_, stop_);
    ++pagesFetched_;

    if (config_.resultKeys.empty()) {
        TokenMap next = extractNextToken(page);
        if (next.empty()) {
            done_ = true;
        } else {
            injectToken(next);
            currentToken_ = next;
        }
        co_return page;
    }

    if (firstRequest_) {
        if (startingTruncation_ > 0) {
            trimFirstPage(page);
        }
        firstRequest_ = false;
    } else {
        // Only the first page was offset by the starting token.
        startingTruncation_ = 0;
    }

    const auto count = static_cast<int64_t>(arraySize(FindPath(page, config_.resultKeys.front())));
    if (options_.maxItems.has_value()) {
        const int64_t truncateAmount = totalItems_ + count - *options_.maxItems;
        if (truncateAmount > 0) {
            truncatePage(page, truncateAmount);
            done_ = true;
            co_return page;
        }
    }

    totalItems_ += count;
    TokenMap next = extractNextToken(page);
    if (next.empty()) {
        done_ = true;
        co_return page;
    }
    if (options_.maxItems.has_value() && totalItems_ == *options_.maxItems) {
        setResumeToken(next, 0);
        done_ = true;
        co_return page;
    }
    if (previousToken_.has_value() && *previousToken_ == next) {
        pendingError_ = "The same next token was received twice: " + encodeToken(next);
        co_return page;
    }
    injectToken(next);
    previousToken_ = next;
    currentToken_ = next;
    co_return page;
}

boost::asio::awaitable<JSONValue> PageIterator::BuildFullResult() {
    JSONValue complete(JSONValue::Object{});
    bool first = true;
    while (true) {
        std::optional<JSONValue> page = co_await Next();
        if (!page.has_value()) {
            break;
        }
        for (const auto& key : config_.resultKeys) {
            const JSONValue* value = FindPath(*page, key);
            if (!value) continue;
            const JSONValue* existing = FindPath(complete, key);
            if (!existing) {
                SetPath(complete, key, *value);
                continue;
            }
            if (value->IsArray() && existing->IsArray()) {
                JSONValue::Array merged = std::get<JSONValue::Array>(existing->value);
                const auto& more = std::get<JSONValue::Array>(value->value);
                merged.insert(merged.end(), more.begin(), more.end());
                SetPath(complete, key, JSONValue(std::move(merged)));
            } else if (std::holds_alternative<int64_t>(value->value) &&
                       std::holds_alternative<int64_t>(existing->value)) {
                SetPath(complete, key,
                        JSONValue(std::get<int64_t>(existing->value) + std::get<int64_t>(value->value)));
            } else if (value->IsString() && existing->IsString()) {
                SetPath(complete, key,
                        JSONValue(std::get<std::string>(existing->value) + std::get<std::string>(value->value)));
            }
        }
        if (first) {
            for (const auto& key : config_.nonAggregateKeys) {
                if (const JSONValue* v = FindPath(*page, key)) {
                    SetPath(complete, key, *v);
                }
            }
            first = false;
        }
    }
    if (resumeToken_.has_value()) {
        SetMember(complete, "NextToken", JSONValue(*resumeToken_));
    }
    co_return complete;
}

Paginator::Paginator(PageFetcher fetcher, model::PaginatorConfig config, std::string operationName)
    : fetcher_(std::move(fetcher)), config_(std::move(config)), operationName_(std::move(operationName)) {}

PageIterator Paginator::Paginate(JSONValue params, PaginationOptions options, std::stop_token stop) const {
    return PageIterator(fetcher_, config_, operationName_, std::move(params), std::move(options), std::move(stop));
}

} // namespace cloudcall
