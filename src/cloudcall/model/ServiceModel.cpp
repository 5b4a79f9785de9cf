//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServiceModel.cpp
// Purpose: Service description parsing and loaders
//==========================================================================================================

#include "cloudcall/model/ServiceModel.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "cloudcall/errors/Errors.h"
#include "logging/Logger.h"

namespace cloudcall {
namespace model {

namespace {

std::string stringOr(const JSONValue& v, const std::string& key, const std::string& def = std::string()) {
    auto s = GetString(v, key);
    return s.has_value() ? *s : def;
}

// Accepts either "Name" or ["A", "B"].
std::vector<std::string> stringList(const JSONValue& v, const std::string& key) {
    std::vector<std::string> out;
    const JSONValue* m = FindMember(v, key);
    if (!m) return out;
    if (m->IsString()) {
        out.push_back(std::get<std::string>(m->value));
        return out;
    }
    if (!m->IsArray()) {
        throw errors::ModelLoadError("'" + key + "' must be a string or list of strings");
    }
    for (const auto& item : std::get<JSONValue::Array>(m->value)) {
        if (!item || !item->IsString()) {
            throw errors::ModelLoadError("'" + key + "' entries must be strings");
        }
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

StructureShape parseStructure(const JSONValue& v);

MemberShape parseMember(const JSONValue& v) {
    if (!v.IsObject()) {
        throw errors::ModelLoadError("member shape must be an object");
    }
    MemberShape m;
    m.type = stringOr(v, "type", "string");
    m.location = stringOr(v, "location");
    m.locationName = stringOr(v, "locationName");
    m.streaming = GetBool(v, "streaming").value_or(false);
    if (m.type == "structure") {
        m.structure = std::make_shared<StructureShape>(parseStructure(v));
    } else if (m.type == "list") {
        if (const JSONValue* elem = FindMember(v, "member")) {
            m.listMember = std::make_shared<MemberShape>(parseMember(*elem));
        }
    }
    return m;
}

StructureShape parseStructure(const JSONValue& v) {
    StructureShape s;
    if (const JSONValue* members = FindMember(v, "members")) {
        if (!members->IsObject()) {
            throw errors::ModelLoadError("'members' must be an object");
        }
        for (const auto& [name, member] : std::get<JSONValue::Object>(members->value)) {
            if (member) s.members.emplace(name, parseMember(*member));
        }
    }
    s.required = stringList(v, "required");
    return s;
}

PaginatorConfig parsePaginator(const JSONValue& v) {
    PaginatorConfig p;
    p.inputTokens = stringList(v, "inputToken");
    p.outputTokens = stringList(v, "outputToken");
    p.resultKeys = stringList(v, "resultKey");
    p.nonAggregateKeys = stringList(v, "nonAggregateKeys");
    if (auto k = GetString(v, "limitKey")) p.limitKey = *k;
    if (auto k = GetString(v, "moreResults")) p.moreResults = *k;
    if (p.inputTokens.empty() || p.inputTokens.size() != p.outputTokens.size()) {
        throw errors::ModelLoadError("paginator inputToken/outputToken must be non-empty and the same length");
    }
    return p;
}

} // namespace

bool OperationModel::HasStreamingInput() const {
    for (const auto& [name, member] : input.members) {
        if (member.streaming) return true;
    }
    return false;
}

std::shared_ptr<const ServiceModel> ServiceModel::FromJson(const JSONValue& description) {
    const JSONValue* meta = FindMember(description, "metadata");
    const JSONValue* ops = FindMember(description, "operations");
    if (!meta || !meta->IsObject()) {
        throw errors::ModelLoadError("missing 'metadata'");
    }
    if (!ops || !ops->IsObject()) {
        throw errors::ModelLoadError("missing 'operations'");
    }

    auto model = std::make_shared<ServiceModel>();
    ServiceMetadata& md = model->metadata_;
    md.endpointPrefix = stringOr(*meta, "endpointPrefix");
    md.protocol = stringOr(*meta, "protocol");
    md.serviceId = stringOr(*meta, "serviceId");
    md.serviceFullName = stringOr(*meta, "serviceFullName");
    md.serviceAbbreviation = stringOr(*meta, "serviceAbbreviation");
    md.signingName = stringOr(*meta, "signingName");
    md.signatureVersion = stringOr(*meta, "signatureVersion", "v4");
    md.targetPrefix = stringOr(*meta, "targetPrefix");
    md.jsonVersion = stringOr(*meta, "jsonVersion", "1.0");
    md.apiVersion = stringOr(*meta, "apiVersion");
    if (md.endpointPrefix.empty() || md.protocol.empty()) {
        throw errors::ModelLoadError("metadata requires 'endpointPrefix' and 'protocol'");
    }

    for (const auto& [name, op] : std::get<JSONValue::Object>(ops->value)) {
        if (!op || !op->IsObject()) {
            throw errors::ModelLoadError("operation '" + name + "' must be an object");
        }
        OperationModel om;
        om.name = name;
        if (const JSONValue* http = FindMember(*op, "http")) {
            om.httpMethod = stringOr(*http, "method", "POST");
            om.requestUri = stringOr(*http, "requestUri", "/");
        }
        if (const JSONValue* in = FindMember(*op, "input")) om.input = parseStructure(*in);
        if (const JSONValue* out = FindMember(*op, "output")) om.output = parseStructure(*out);
        if (const JSONValue* pg = FindMember(*op, "paginator")) om.paginator = parsePaginator(*pg);
        model->operations_.emplace(name, std::move(om));
    }
    LOG_DEBUG("Loaded service model '{}' ({} operations, protocol {})",
              md.endpointPrefix, model->operations_.size(), md.protocol);
    return model;
}

const OperationModel* ServiceModel::FindOperation(const std::string& name) const {
    auto it = operations_.find(name);
    return it == operations_.end() ? nullptr : &it->second;
}

const OperationModel& ServiceModel::GetOperation(const std::string& name) const {
    const OperationModel* op = FindOperation(name);
    if (!op) {
        throw errors::UnknownOperationError(name);
    }
    return *op;
}

std::vector<std::string> ServiceModel::OperationNames() const {
    std::vector<std::string> names;
    names.reserve(operations_.size());
    for (const auto& [name, op] : operations_) names.push_back(name);
    return names;
}

FileServiceModelLoader::FileServiceModelLoader(std::string searchPath)
    : searchPath_(std::move(searchPath)) {}

std::shared_ptr<const ServiceModel> FileServiceModelLoader::LoadServiceModel(const std::string& serviceName) {
    std::lock_guard<std::mutex> lk(cacheMutex_);
    auto it = cache_.find(serviceName);
    if (it != cache_.end()) {
        return it->second;
    }
    const std::string path = searchPath_ + "/" + serviceName + ".json";
    std::ifstream in(path);
    if (!in.is_open()) {
        throw errors::ModelLoadError("no description for service '" + serviceName + "' at " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    JSONValue doc;
    try {
        doc = ParseJSON(buf.str());
    } catch (const std::runtime_error& e) {
        throw errors::ModelLoadError(path + ": " + e.what());
    }
    auto model = ServiceModel::FromJson(doc);
    cache_.emplace(serviceName, model);
    return model;
}

void InMemoryServiceModelLoader::Register(const std::string& serviceName, std::shared_ptr<const ServiceModel> model) {
    models_[serviceName] = std::move(model);
}

std::shared_ptr<const ServiceModel> InMemoryServiceModelLoader::LoadServiceModel(const std::string& serviceName) {
    auto it = models_.find(serviceName);
    if (it == models_.end()) {
        throw errors::ModelLoadError("no description registered for service '" + serviceName + "'");
    }
    return it->second;
}

} // namespace model
} // namespace cloudcall
