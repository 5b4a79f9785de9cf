//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServiceModel.h
// Purpose: In-memory service description: metadata, operations, shapes and pagination metadata
//==========================================================================================================

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cloudcall/JSONValue.h"

namespace cloudcall {
namespace model {

struct StructureShape;

//==========================================================================================================
// MemberShape
// Purpose: One input/output member.
// Fields:
//   type: string | integer | long | boolean | double | float | blob | timestamp | list | map | structure.
//   location: "" (body) | uri | querystring | header.
//   locationName: Wire name when it differs from the member name.
//   streaming: Payload member streamed rather than buffered.
//   structure: Nested shape when type == structure.
//   listMember: Element shape when type == list.
//==========================================================================================================
struct MemberShape {
    std::string type{"string"};
    std::string location;
    std::string locationName;
    bool streaming{false};
    std::shared_ptr<StructureShape> structure;
    std::shared_ptr<MemberShape> listMember;
};

struct StructureShape {
    std::map<std::string, MemberShape> members;
    std::vector<std::string> required;
};

//==========================================================================================================
// PaginatorConfig
// Purpose: Per-operation pagination metadata.
// Fields:
//   inputTokens: Request members receiving the continuation token(s).
//   outputTokens: Response paths (dotted) holding the next token(s), positionally matched to inputTokens.
//   resultKeys: Response paths holding the page results.
//   limitKey: Request member that caps page size.
//   moreResults: Response path of a boolean "has more" flag.
//   nonAggregateKeys: Response paths copied (not concatenated) into a full result.
//==========================================================================================================
struct PaginatorConfig {
    std::vector<std::string> inputTokens;
    std::vector<std::string> outputTokens;
    std::vector<std::string> resultKeys;
    std::optional<std::string> limitKey;
    std::optional<std::string> moreResults;
    std::vector<std::string> nonAggregateKeys;
};

struct ServiceMetadata {
    std::string endpointPrefix;
    std::string protocol;
    std::string serviceId;
    std::string serviceFullName;
    std::string serviceAbbreviation;
    std::string signingName;
    std::string signatureVersion;
    std::string targetPrefix;
    std::string jsonVersion;
    std::string apiVersion;
};

//==========================================================================================================
// OperationModel
// Purpose: Dispatch-table entry for one operation.
//==========================================================================================================
class OperationModel {
public:
    std::string name;
    std::string httpMethod{"POST"};
    std::string requestUri{"/"};
    StructureShape input;
    StructureShape output;
    std::optional<PaginatorConfig> paginator;

    // True when any input member is a streaming payload.
    bool HasStreamingInput() const;
    bool CanPaginate() const { return paginator.has_value(); }
};

//==========================================================================================================
// ServiceModel
// Purpose: Read-only service description consulted by the client factory and the call pipeline.
//==========================================================================================================
class ServiceModel {
public:
    //==========================================================================================================
    // FromJson
    // Purpose: Builds a model from { "metadata": {...}, "operations": { "<Name>": {...} } }.
    // Throws:
    //   errors::ModelLoadError when required sections are missing or malformed.
    //==========================================================================================================
    static std::shared_ptr<const ServiceModel> FromJson(const JSONValue& description);

    const ServiceMetadata& Metadata() const { return metadata_; }
    const std::string& EndpointPrefix() const { return metadata_.endpointPrefix; }
    const std::string& Protocol() const { return metadata_.protocol; }
    // Name used for hook scoping and config injection.
    const std::string& ServiceName() const { return metadata_.endpointPrefix; }
    const std::string& SigningName() const {
        return metadata_.signingName.empty() ? metadata_.endpointPrefix : metadata_.signingName;
    }

    // nullptr when the operation is not declared.
    const OperationModel* FindOperation(const std::string& name) const;

    // Throws errors::UnknownOperationError when the operation is not declared.
    const OperationModel& GetOperation(const std::string& name) const;

    std::vector<std::string> OperationNames() const;

private:
    ServiceMetadata metadata_;
    std::map<std::string, OperationModel> operations_;
};

//==========================================================================================================
// IServiceModelLoader
// Purpose: Source of service descriptions by service name.
//==========================================================================================================
class IServiceModelLoader {
public:
    virtual ~IServiceModelLoader() = default;
    virtual std::shared_ptr<const ServiceModel> LoadServiceModel(const std::string& serviceName) = 0;
};

//==========================================================================================================
// FileServiceModelLoader
// Purpose: Loads <searchPath>/<serviceName>.json and caches the parsed model.
//==========================================================================================================
class FileServiceModelLoader : public IServiceModelLoader {
public:
    explicit FileServiceModelLoader(std::string searchPath);
    std::shared_ptr<const ServiceModel> LoadServiceModel(const std::string& serviceName) override;

private:
    std::string searchPath_;
    std::mutex cacheMutex_;
    std::unordered_map<std::string, std::shared_ptr<const ServiceModel>> cache_;
};

//==========================================================================================================
// InMemoryServiceModelLoader
// Purpose: Loader backed by descriptions registered up front (embedding and tests).
//==========================================================================================================
class InMemoryServiceModelLoader : public IServiceModelLoader {
public:
    void Register(const std::string& serviceName, std::shared_ptr<const ServiceModel> model);
    std::shared_ptr<const ServiceModel> LoadServiceModel(const std::string& serviceName) override;

private:
    std::unordered_map<std::string, std::shared_ptr<const ServiceModel>> models_;
};

} // namespace model
} // namespace cloudcall
