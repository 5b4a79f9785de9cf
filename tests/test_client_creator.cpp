//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client_creator.cpp
// Purpose: Tests for client argument assembly, class generation and the S3 host rewrite
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "cloudcall/ClientCreator.h"
#include "cloudcall/errors/Errors.h"
#include "cloudcall/http/HttpEndpoint.hpp"

using namespace cloudcall;
using boost::asio::awaitable;

namespace {

const char* kStorageService = R"({
  "metadata": {"endpointPrefix": "s3", "protocol": "rest-json", "signatureVersion": "s3v4",
               "serviceFullName": "Amazon Simple Storage Service", "serviceAbbreviation": "Amazon S3"},
  "operations": {
    "ListBuckets": {"http": {"method": "GET", "requestUri": "/"}},
    "ListObjects": {
      "http": {"method": "GET", "requestUri": "/{Bucket}"},
      "input": {"required": ["Bucket"], "members": {"Bucket": {"location": "uri", "locationName": "Bucket"},
                                                    "Prefix": {"location": "querystring", "locationName": "prefix"}}}
    },
    "HeadBucket": {
      "http": {"method": "HEAD", "requestUri": "/{Bucket}"},
      "input": {"required": ["Bucket"], "members": {"Bucket": {"location": "uri", "locationName": "Bucket"}}}
    }
  }
})";

class RecordingEndpoint : public IEndpoint {
public:
    explicit RecordingEndpoint(std::string host) : host_(std::move(host)) {}

    std::vector<RequestRecord> requests;

    const std::string& Host() const override { return host_; }

    awaitable<EndpointResponse> MakeRequest(const model::OperationModel& op, RequestRecord& request,
                                            std::stop_token) override {
        requests.push_back(request);
        EndpointResponse out;
        out.http.statusCode = 200;
        out.http.body = "{}";
        out.parsed = protocol::CreateParser("rest-json")->Parse(out.http, op);
        co_return out;
    }

    void Open() override { open_ = true; }
    void Close() override { open_ = false; }
    bool IsOpen() const override { return open_; }

private:
    std::string host_;
    bool open_{false};
};

struct CreatorFixture {
    boost::asio::io_context io;
    std::shared_ptr<model::InMemoryServiceModelLoader> loader = std::make_shared<model::InMemoryServiceModelLoader>();
    std::shared_ptr<const model::ServiceModel> storage = model::ServiceModel::FromJson(ParseJSON(kStorageService));
    TemplateEndpointResolver resolver;
    std::unique_ptr<ClientCreator> creator;

    CreatorFixture() {
        loader->Register("s3", storage);
        creator = std::make_unique<ClientCreator>(io.get_executor(), loader,
                                                  std::make_shared<TemplateEndpointResolver>());
    }

    ClientArgs Args(const std::optional<config::ClientConfig>& clientConfig = std::nullopt,
                    const config::ScopedConfig& scoped = {},
                    const std::optional<std::string>& endpointUrl = std::nullopt) {
        return creator->GetClientArgs(storage, std::string("us-west-2"), true, endpointUrl, true, std::nullopt,
                                      scoped, clientConfig, resolver);
    }

    // Binds a client whose dispatch is recorded instead of sent.
    std::pair<std::shared_ptr<BaseClient>, std::shared_ptr<RecordingEndpoint>> RecordingClient(ClientArgs args) {
        auto endpoint = std::make_shared<RecordingEndpoint>(args.endpoint->Host());
        args.endpoint = endpoint;
        auto client = std::make_shared<BaseClient>(creator->CreateClientClass("s3", *storage), std::move(args));
        return {client, endpoint};
    }

    JSONValue Call(BaseClient& client, const std::string& method, const char* params) {
        auto fut = boost::asio::co_spawn(io, client.Invoke(method, ParseJSON(params)), boost::asio::use_future);
        io.run();
        io.restart();
        EXPECT_EQ(fut.wait_for(std::chrono::seconds(0)), std::future_status::ready);
        return fut.get();
    }
};

config::ScopedConfig scopedFrom(const char* text) {
    return std::get<JSONValue::Object>(ParseJSON(text).value);
}

bool serializerValidates(const ClientArgs& args, const model::ServiceModel& service) {
    RequestContext ctx;
    try {
        (void)args.serializer->SerializeToRequest(ParseJSON(R"({"Bucket": "b", "Bogus": 1})"),
                                                  service.GetOperation("ListObjects"), service.Metadata(), ctx);
        return false;
    } catch (const errors::ParamValidationError&) {
        return true;
    }
}

} // namespace

TEST(ClientCreator, ParameterValidationPrecedence) {
    CreatorFixture f;
    EXPECT_TRUE(serializerValidates(f.Args(), *f.storage));

    EXPECT_FALSE(serializerValidates(f.Args(std::nullopt, scopedFrom(R"({"parameter_validation": "FALSE"})")),
                                     *f.storage));
    EXPECT_FALSE(serializerValidates(f.Args(std::nullopt, scopedFrom(R"({"parameter_validation": false})")),
                                     *f.storage));
    EXPECT_TRUE(serializerValidates(f.Args(std::nullopt, scopedFrom(R"({"parameter_validation": "yes"})")),
                                    *f.storage));

    config::ClientConfigOptions off;
    off.parameterValidation = false;
    ClientArgs args = f.Args(config::ClientConfig(off));
    EXPECT_FALSE(serializerValidates(args, *f.storage));
    EXPECT_FALSE(args.clientConfig.ParameterValidation());
}

TEST(ClientCreator, UserAgentComposition) {
    CreatorFixture f;
    EXPECT_EQ(f.Args().clientConfig.UserAgent().value_or(""), DefaultUserAgent());

    config::ClientConfigOptions replaced;
    replaced.userAgent = "custom/1.0";
    EXPECT_EQ(f.Args(config::ClientConfig(replaced)).clientConfig.UserAgent().value_or(""), "custom/1.0");

    config::ClientConfigOptions extra;
    extra.userAgentExtra = "tool/2.0";
    EXPECT_EQ(f.Args(config::ClientConfig(extra)).clientConfig.UserAgent().value_or(""),
              DefaultUserAgent() + " tool/2.0");

    config::ClientConfigOptions both;
    both.userAgent = "custom/1.0";
    both.userAgentExtra = "tool/2.0";
    EXPECT_EQ(f.Args(config::ClientConfig(both)).clientConfig.UserAgent().value_or(""), "custom/1.0 tool/2.0");
}

TEST(ClientCreator, ResolvesEndpointAndTimeouts) {
    CreatorFixture f;
    config::ClientConfigOptions opts;
    opts.connectTimeout = 5.0;
    opts.readTimeout = 9.0;
    ClientArgs args = f.Args(config::ClientConfig(opts));

    EXPECT_EQ(args.endpoint->Host(), "https://s3.us-west-2.amazonaws.com");
    EXPECT_EQ(args.clientConfig.RegionName().value_or(""), "us-west-2");
    EXPECT_EQ(args.clientConfig.SignatureVersion().value_or(""), "s3v4");
    auto httpEndpoint = std::dynamic_pointer_cast<http::HttpEndpoint>(args.endpoint);
    ASSERT_TRUE(httpEndpoint != nullptr);
    EXPECT_DOUBLE_EQ(httpEndpoint->Timeouts().connectTimeoutSeconds, 5.0);
    EXPECT_DOUBLE_EQ(httpEndpoint->Timeouts().readTimeoutSeconds, 9.0);
    EXPECT_EQ(args.requestSigner->SigningRegion(), "us-west-2");
    EXPECT_EQ(args.requestSigner->SigningName(), "s3");
    EXPECT_EQ(args.serviceModel, f.storage);

    EXPECT_THROW(f.creator->GetClientArgs(f.storage, std::nullopt, true, std::nullopt, true, std::nullopt, {},
                                          std::nullopt, f.resolver),
                 errors::NoRegionError);
}

TEST(ClientCreator, InvalidConnectorArgsFailClientCreation) {
    CreatorFixture f;
    config::ClientConfigOptions opts;
    config::ConnectorArgs connector;
    connector[config::ConnectorKeys::Limit] = std::string("ten");
    opts.connectorArgs = connector;
    EXPECT_THROW(f.Args(config::ClientConfig(opts)), errors::ConfigValidationError);
}

TEST(ClientCreator, ClientGetsIndependentEmitterCopy) {
    CreatorFixture f;
    const auto& base = f.creator->GetEventEmitter();
    const std::size_t baseCount = base->HandlerCount(events::EventKind::BeforeCall);

    ClientArgs args = f.Args();
    ASSERT_TRUE(args.eventEmitter != nullptr);
    EXPECT_NE(args.eventEmitter, base);
    EXPECT_EQ(args.requestSigner->GetEventEmitter(), args.eventEmitter);

    args.eventEmitter->OnBeforeCall("s3", [](events::BeforeCallEvent&) {});
    EXPECT_EQ(base->HandlerCount(events::EventKind::BeforeCall), baseCount);
    EXPECT_EQ(args.eventEmitter->HandlerCount(events::EventKind::BeforeCall), baseCount + 1);
}

TEST(ClientCreator, EndpointOverrideDropsS3HostRewrite) {
    CreatorFixture f;
    const auto& base = f.creator->GetEventEmitter();
    EXPECT_TRUE(base->HasUniqueId(events::EventKind::BeforeCall, kFixS3HostHandlerId));

    EXPECT_TRUE(f.Args().eventEmitter->HasUniqueId(events::EventKind::BeforeCall, kFixS3HostHandlerId));
    ClientArgs overridden = f.Args(std::nullopt, {}, std::string("http://localhost:9000"));
    EXPECT_FALSE(overridden.eventEmitter->HasUniqueId(events::EventKind::BeforeCall, kFixS3HostHandlerId));
    EXPECT_EQ(overridden.endpoint->Host(), "http://localhost:9000");
    EXPECT_TRUE(base->HasUniqueId(events::EventKind::BeforeCall, kFixS3HostHandlerId));
}

TEST(ClientCreator, S3ConfigMergesScopedThenExplicit) {
    CreatorFixture f;
    config::ClientConfigOptions opts;
    opts.s3 = config::S3Options{std::nullopt, true};
    ClientArgs args = f.Args(config::ClientConfig(opts),
                             scopedFrom(R"({"s3": {"addressing_style": "path", "use_accelerate_endpoint": "false"}})"));
    ASSERT_TRUE(args.clientConfig.S3().has_value());
    EXPECT_EQ(args.clientConfig.S3()->addressingStyle.value_or(""), "path");
    EXPECT_TRUE(args.clientConfig.S3()->useAccelerateEndpoint.value_or(false));
}

TEST(ClientCreator, CustomConfigInjector) {
    CreatorFixture f;
    f.creator->RegisterConfigInjector("s3", [](ConfigInjectionContext& ctx) {
        ctx.kwargs.readTimeout = 1.5;
        EXPECT_EQ(ctx.endpoint.region, "us-west-2");
    });
    EXPECT_DOUBLE_EQ(f.Args().clientConfig.ReadTimeout(), 1.5);
}

TEST(ClientCreator, ClassHookFiresOncePerService) {
    CreatorFixture f;
    int hookCalls = 0;
    f.creator->GetEventEmitter()->OnCreatingClientClass("s3", [&](events::CreatingClientClassEvent& e) {
        ++hookCalls;
        e.capabilities.push_back("BucketHelpers");
        e.methods.erase("head_bucket");
        e.methods["bucket_exists"] = MethodBinding{
            "", [](BaseClient& client, const JSONValue& params, std::stop_token stop) -> awaitable<JSONValue> {
                co_return co_await client.MakeApiCall("HeadBucket", params, stop);
            }};
    });

    CreateClientOptions opts;
    opts.region = "us-west-2";
    opts.scopedConfig = config::ScopedConfig{};
    auto first = f.creator->CreateClient("s3", opts);
    auto second = f.creator->CreateClient("s3", opts);
    EXPECT_EQ(hookCalls, 1);
    EXPECT_EQ(&first->Class(), &second->Class());

    const ClientClass& cls = first->Class();
    EXPECT_EQ(cls.className, "S3");
    EXPECT_EQ(cls.capabilities, (std::vector<std::string>{"BaseClient", "BucketHelpers"}));
    EXPECT_TRUE(cls.FindMethod("list_buckets") != nullptr);
    EXPECT_TRUE(cls.FindMethod("list_objects") != nullptr);
    EXPECT_EQ(cls.FindMethod("head_bucket"), nullptr);
    ASSERT_TRUE(cls.FindMethod("bucket_exists") != nullptr);
    EXPECT_EQ(cls.methodToOperation.at("list_buckets"), "ListBuckets");
    EXPECT_EQ(cls.methodToOperation.count("bucket_exists"), 0u);

    auto [client, endpoint] = f.RecordingClient(f.Args());
    (void)f.Call(*client, "bucket_exists", R"({"Bucket": "photos"})");
    ASSERT_EQ(endpoint->requests.size(), 1u);
    EXPECT_EQ(endpoint->requests[0].method, "HEAD");
}

TEST(ClientCreator, ClassHookMayCreateAnotherClient) {
    CreatorFixture f;
    f.loader->Register("sqs", model::ServiceModel::FromJson(ParseJSON(R"({
      "metadata": {"endpointPrefix": "sqs", "protocol": "json", "signatureVersion": "v4",
                   "serviceAbbreviation": "Amazon SQS", "targetPrefix": "AmazonSQS", "jsonVersion": "1.0"},
      "operations": {"ListQueues": {"http": {"method": "POST", "requestUri": "/"}}}
    })")));

    CreateClientOptions opts;
    opts.region = "us-west-2";
    opts.scopedConfig = config::ScopedConfig{};

    int hookCalls = 0;
    std::shared_ptr<BaseClient> queues;
    f.creator->GetEventEmitter()->OnCreatingClientClass("s3", [&](events::CreatingClientClassEvent&) {
        ++hookCalls;
        queues = f.creator->CreateClient("sqs", opts);
    });

    auto storageClient = f.creator->CreateClient("s3", opts);
    EXPECT_EQ(hookCalls, 1);
    ASSERT_TRUE(queues != nullptr);
    EXPECT_EQ(queues->Class().className, "SQS");
    EXPECT_TRUE(queues->Class().FindMethod("list_queues") != nullptr);
    EXPECT_EQ(storageClient->Class().className, "S3");

    (void)f.creator->CreateClient("s3", opts);
    EXPECT_EQ(hookCalls, 1);
}

TEST(ClientCreator, CreateClientUsesScopedRegion) {
    CreatorFixture f;
    CreateClientOptions opts;
    opts.scopedConfig = scopedFrom(R"({"region": "eu-central-1"})");
    auto client = f.creator->CreateClient("s3", opts);
    EXPECT_EQ(client->Meta().regionName, "eu-central-1");
    EXPECT_EQ(client->Meta().endpointUrl, "https://s3.eu-central-1.amazonaws.com");
    EXPECT_FALSE(client->IsOpen());

    CreateClientOptions none;
    none.scopedConfig = config::ScopedConfig{};
    EXPECT_THROW(f.creator->CreateClient("s3", none), errors::NoRegionError);
    EXPECT_THROW(f.creator->CreateClient("sqs", opts), errors::ModelLoadError);
}

TEST(ClientCreator, S3RequestsUseVirtualHostedStyle) {
    CreatorFixture f;
    auto [client, endpoint] = f.RecordingClient(f.Args());
    (void)f.Call(*client, "list_objects", R"({"Bucket": "photos", "Prefix": "2024/"})");
    (void)f.Call(*client, "list_buckets", "{}");
    (void)f.Call(*client, "list_objects", R"({"Bucket": "Not_DNS"})");
    ASSERT_EQ(endpoint->requests.size(), 3u);
    EXPECT_EQ(endpoint->requests[0].url, "https://photos.s3.us-west-2.amazonaws.com/?prefix=2024%2F");
    EXPECT_EQ(endpoint->requests[1].url, "https://s3.us-west-2.amazonaws.com/");
    EXPECT_EQ(endpoint->requests[2].url, "https://s3.us-west-2.amazonaws.com/Not_DNS");
}

TEST(ClientCreator, S3PathStyleAndOverrideKeepPath) {
    CreatorFixture f;
    config::ClientConfigOptions pathStyle;
    pathStyle.s3 = config::S3Options{std::string("path"), std::nullopt};
    auto [pathClient, pathEndpoint] = f.RecordingClient(f.Args(config::ClientConfig(pathStyle)));
    (void)f.Call(*pathClient, "list_objects", R"({"Bucket": "photos"})");
    EXPECT_EQ(pathEndpoint->requests.at(0).url, "https://s3.us-west-2.amazonaws.com/photos");

    auto [localClient, localEndpoint] =
        f.RecordingClient(f.Args(std::nullopt, {}, std::string("http://localhost:9000")));
    (void)f.Call(*localClient, "list_objects", R"({"Bucket": "photos"})");
    EXPECT_EQ(localEndpoint->requests.at(0).url, "http://localhost:9000/photos");

    config::ClientConfigOptions accelerate;
    accelerate.s3 = config::S3Options{std::nullopt, true};
    auto [fastClient, fastEndpoint] = f.RecordingClient(f.Args(config::ClientConfig(accelerate)));
    (void)f.Call(*fastClient, "list_objects", R"({"Bucket": "photos"})");
    EXPECT_EQ(fastEndpoint->requests.at(0).url, "https://photos.s3-accelerate.amazonaws.com/");
}

TEST(ClientCreator, DnsCompatibleBucketNames) {
    EXPECT_TRUE(IsDnsCompatibleBucketName("photos"));
    EXPECT_TRUE(IsDnsCompatibleBucketName("my-bucket.logs"));
    EXPECT_FALSE(IsDnsCompatibleBucketName("ab"));
    EXPECT_FALSE(IsDnsCompatibleBucketName("Upper"));
    EXPECT_FALSE(IsDnsCompatibleBucketName("a..b"));
    EXPECT_FALSE(IsDnsCompatibleBucketName("-leading"));
    EXPECT_FALSE(IsDnsCompatibleBucketName("192.168.1.1"));
}
