//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Naming.h
// Purpose: Operation-to-method and service-to-class name conversion
//==========================================================================================================

#pragma once

#include <string>

#include "cloudcall/model/ServiceModel.h"

namespace cloudcall {
namespace util {

//==========================================================================================================
// XformName
// Purpose: CamelCase to snake_case the way generated clients name their methods.
//          "ListBuckets" -> "list_buckets", "DescribeDBInstances" -> "describe_db_instances".
//          Names that already contain the separator are returned unchanged.
//==========================================================================================================
std::string XformName(const std::string& name, char sep = '_');

// Class name for a service: abbreviation (or full name) without "Amazon"/"AWS", alphanumerics only.
std::string ServiceClassName(const model::ServiceMetadata& metadata);

// ASCII lower-case copy.
std::string ToLower(std::string s);

} // namespace util
} // namespace cloudcall
