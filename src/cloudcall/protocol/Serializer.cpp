//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Serializer.cpp
// Purpose: json / rest-json request serializers and input validation
//==========================================================================================================

#include "cloudcall/protocol/Serializer.h"

#include <sstream>
#include <vector>

#include "cloudcall/errors/Errors.h"
#include "logging/Logger.h"

namespace cloudcall {
namespace protocol {

namespace {

//==========================================================================================================
// Validation
//==========================================================================================================
class ParamValidator {
public:
    std::string Validate(const JSONValue& params, const model::StructureShape& shape) {
        if (params.IsNull()) {
            checkStructure(JSONValue(JSONValue::Object{}), shape, "input");
        } else {
            checkStructure(params, shape, "input");
        }
        std::ostringstream oss;
        for (std::size_t i = 0; i < problems_.size(); ++i) {
            if (i) oss << "\n";
            oss << problems_[i];
        }
        return oss.str();
    }

private:
    std::vector<std::string> problems_;

    static std::string join(const std::string& path, const std::string& name) {
        return path == "input" ? name : path + "." + name;
    }

    void invalidType(const JSONValue& v, const std::string& path, const char* validTypes) {
        problems_.push_back("Invalid type for parameter " + path + ", value: " + SerializeJSON(v) +
                            ", type: " + TypeName(v) + ", valid types: " + validTypes);
    }

    void checkStructure(const JSONValue& v, const model::StructureShape& shape, const std::string& path) {
        if (!v.IsObject()) {
            invalidType(v, path, "object");
            return;
        }
        const auto& obj = std::get<JSONValue::Object>(v.value);
        for (const auto& req : shape.required) {
            auto it = obj.find(req);
            if (it == obj.end() || !it->second || it->second->IsNull()) {
                problems_.push_back("Missing required parameter in " + path + ": \"" + req + "\"");
            }
        }
        for (const auto& [name, member] : obj) {
            auto m = shape.members.find(name);
            if (m == shape.members.end()) {
                std::string valid;
                for (const auto& [known, unused] : shape.members) {
                    valid += valid.empty() ? known : ", " + known;
                }
                problems_.push_back("Unknown parameter in " + path + ": \"" + name + "\", must be one of: " + valid);
                continue;
            }
            if (member) {
                checkMember(*member, m->second, join(path, name));
            }
        }
    }

    void checkMember(const JSONValue& v, const model::MemberShape& shape, const std::string& path) {
        const std::string& t = shape.type;
        if (t == "string" || t == "blob") {
            if (!v.IsString()) invalidType(v, path, "string");
        } else if (t == "integer" || t == "long") {
            if (!std::holds_alternative<int64_t>(v.value)) invalidType(v, path, "integer");
        } else if (t == "boolean") {
            if (!std::holds_alternative<bool>(v.value)) invalidType(v, path, "boolean");
        } else if (t == "double" || t == "float") {
            if (!std::holds_alternative<double>(v.value) && !std::holds_alternative<int64_t>(v.value)) {
                invalidType(v, path, "float, integer");
            }
        } else if (t == "timestamp") {
            if (!v.IsString() && !std::holds_alternative<int64_t>(v.value) &&
                !std::holds_alternative<double>(v.value)) {
                invalidType(v, path, "string, integer, float");
            }
        } else if (t == "list") {
            if (!v.IsArray()) {
                invalidType(v, path, "list");
                return;
            }
            if (!shape.listMember) return;
            const auto& arr = std::get<JSONValue::Array>(v.value);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                if (arr[i]) checkMember(*arr[i], *shape.listMember, path + "[" + std::to_string(i) + "]");
            }
        } else if (t == "map") {
            if (!v.IsObject()) invalidType(v, path, "object");
        } else if (t == "structure") {
            if (shape.structure) {
                checkStructure(v, *shape.structure, path);
            } else if (!v.IsObject()) {
                invalidType(v, path, "object");
            }
        }
    }
};

void validateOrThrow(bool validate, const JSONValue& params, const model::OperationModel& op) {
    if (!validate) return;
    std::string report = ValidateParameters(params, op.input);
    if (!report.empty()) {
        LOG_DEBUG("Parameter validation failed for {}: {}", op.name, report);
        throw errors::ParamValidationError(report);
    }
}

std::string scalarToString(const JSONValue& v) {
    if (v.IsString()) return std::get<std::string>(v.value);
    if (std::holds_alternative<bool>(v.value)) return std::get<bool>(v.value) ? "true" : "false";
    if (std::holds_alternative<int64_t>(v.value)) return std::to_string(std::get<int64_t>(v.value));
    return SerializeJSON(v);
}

const std::string& wireName(const std::string& memberName, const model::MemberShape& m) {
    return m.locationName.empty() ? memberName : m.locationName;
}

//==========================================================================================================
// json: POST / with X-Amz-Target and the params as the JSON body.
//==========================================================================================================
class JsonSerializer : public ISerializer {
public:
    explicit JsonSerializer(bool validate) : validate_(validate) {}

    RequestRecord SerializeToRequest(const JSONValue& params,
                                     const model::OperationModel& op,
                                     const model::ServiceMetadata& metadata,
                                     RequestContext& context) const override {
        (void)context;
        validateOrThrow(validate_, params, op);
        RequestRecord req;
        req.method = "POST";
        req.urlPath = "/";
        if (!metadata.targetPrefix.empty()) {
            req.headers["X-Amz-Target"] = metadata.targetPrefix + "." + op.name;
        }
        req.headers["Content-Type"] = "application/x-amz-json-" + metadata.jsonVersion;
        req.body = params.IsNull() ? std::string("{}") : SerializeJSON(params);
        return req;
    }

private:
    bool validate_;
};

//==========================================================================================================
// rest-json: members routed by location; remaining members form the JSON body.
//==========================================================================================================
class RestJsonSerializer : public ISerializer {
public:
    explicit RestJsonSerializer(bool validate) : validate_(validate) {}

    RequestRecord SerializeToRequest(const JSONValue& params,
                                     const model::OperationModel& op,
                                     const model::ServiceMetadata& metadata,
                                     RequestContext& context) const override {
        (void)metadata;
        validateOrThrow(validate_, params, op);
        const std::string payloadMember = context.hasStreamingInput ? streamingMember(op) : std::string();
        RequestRecord req;
        req.method = op.httpMethod;

        std::string uri = op.requestUri;
        std::string staticQuery;
        std::size_t q = uri.find('?');
        if (q != std::string::npos) {
            staticQuery = uri.substr(q + 1);
            uri = uri.substr(0, q);
        }
        addStaticQuery(req, staticQuery);

        JSONValue::Object uriValues;
        JSONValue body(JSONValue::Object{});
        bool hasBody = false;
        if (params.IsObject()) {
            for (const auto& [name, value] : std::get<JSONValue::Object>(params.value)) {
                if (!value || value->IsNull()) continue;
                auto m = op.input.members.find(name);
                if (!payloadMember.empty() && name == payloadMember) {
                    req.body = scalarToString(*value);
                    continue;
                }
                if (m == op.input.members.end() || m->second.location.empty()) {
                    if (!payloadMember.empty()) continue;
                    const std::string key = (m == op.input.members.end()) ? name : wireName(name, m->second);
                    SetMember(body, key, *value);
                    hasBody = true;
                    continue;
                }
                const std::string& loc = m->second.location;
                const std::string& wire = wireName(name, m->second);
                if (loc == "uri") {
                    uriValues[wire] = value;
                } else if (loc == "querystring") {
                    if (value->IsArray()) {
                        for (const auto& item : std::get<JSONValue::Array>(value->value)) {
                            if (item) req.queryString.emplace_back(wire, scalarToString(*item));
                        }
                    } else {
                        req.queryString.emplace_back(wire, scalarToString(*value));
                    }
                } else if (loc == "header") {
                    req.headers[wire] = scalarToString(*value);
                }
            }
        }
        req.urlPath = expandLabels(uri, uriValues);
        if (!payloadMember.empty()) {
            context.extras["payload_member"] = std::make_shared<JSONValue>(payloadMember);
            if (req.headers.find("Content-Type") == req.headers.end()) {
                req.headers["Content-Type"] = "application/octet-stream";
            }
        } else if (hasBody) {
            req.body = SerializeJSON(body);
            req.headers["Content-Type"] = "application/json";
        }
        return req;
    }

private:
    bool validate_;

    // Body member carrying a streaming payload, or "". When set, it is the whole body.
    static std::string streamingMember(const model::OperationModel& op) {
        for (const auto& [name, member] : op.input.members) {
            if (member.streaming && member.location.empty()) return name;
        }
        return std::string();
    }

    static void addStaticQuery(RequestRecord& req, const std::string& query) {
        std::size_t pos = 0;
        while (pos < query.size()) {
            std::size_t amp = query.find('&', pos);
            std::string part = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
            if (!part.empty()) {
                std::size_t eq = part.find('=');
                if (eq == std::string::npos) {
                    req.queryString.emplace_back(part, std::string());
                } else {
                    req.queryString.emplace_back(part.substr(0, eq), part.substr(eq + 1));
                }
            }
            if (amp == std::string::npos) break;
            pos = amp + 1;
        }
    }

    // {Name} is fully encoded; {Name+} keeps '/'.
    static std::string expandLabels(const std::string& uri, const JSONValue::Object& values) {
        std::string out;
        std::size_t pos = 0;
        while (pos < uri.size()) {
            std::size_t open = uri.find('{', pos);
            if (open == std::string::npos) {
                out += uri.substr(pos);
                break;
            }
            std::size_t close = uri.find('}', open);
            if (close == std::string::npos) {
                out += uri.substr(pos);
                break;
            }
            out += uri.substr(pos, open - pos);
            std::string label = uri.substr(open + 1, close - open - 1);
            bool greedy = !label.empty() && label.back() == '+';
            if (greedy) label.pop_back();
            auto it = values.find(label);
            if (it == values.end() || !it->second) {
                throw errors::ParamValidationError("Missing required parameter in input: \"" + label + "\"");
            }
            out += PercentEncode(scalarToString(*it->second), !greedy);
            pos = close + 1;
        }
        return out.empty() ? std::string("/") : out;
    }
};

} // namespace

std::string ValidateParameters(const JSONValue& params, const model::StructureShape& shape) {
    ParamValidator validator;
    return validator.Validate(params, shape);
}

std::shared_ptr<ISerializer> CreateSerializer(const std::string& protocol, bool validate) {
    if (protocol == "json") {
        return std::make_shared<JsonSerializer>(validate);
    }
    if (protocol == "rest-json") {
        return std::make_shared<RestJsonSerializer>(validate);
    }
    throw errors::UnknownProtocolError(protocol);
}

} // namespace protocol
} // namespace cloudcall
