//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_naming.cpp
// Purpose: Tests for method-name conversion and client class naming
//==========================================================================================================

#include <gtest/gtest.h>

#include "cloudcall/util/Naming.h"

using namespace cloudcall;
using namespace cloudcall::util;

TEST(Naming, XformNameSnakeCasesOperationNames) {
    EXPECT_EQ(XformName("ListBuckets"), "list_buckets");
    EXPECT_EQ(XformName("DescribeDBInstances"), "describe_db_instances");
    EXPECT_EQ(XformName("GetObject"), "get_object");
    EXPECT_EQ(XformName("CreateCacheCluster"), "create_cache_cluster");
    EXPECT_EQ(XformName("PutBucketACL"), "put_bucket_acl");
    EXPECT_EQ(XformName("ListObjectsV2"), "list_objects_v2");
}

TEST(Naming, XformNameLeavesSeparatedNamesAlone) {
    EXPECT_EQ(XformName("already_snake"), "already_snake");
    EXPECT_EQ(XformName("ListBuckets", '-'), "list-buckets");
}

TEST(Naming, XformNameIsStableAcrossCalls) {
    const std::string first = XformName("DescribeDBInstances");
    EXPECT_EQ(XformName("DescribeDBInstances"), first);
}

TEST(Naming, ServiceClassNameStripsVendorPrefixes) {
    model::ServiceMetadata s3;
    s3.endpointPrefix = "s3";
    s3.serviceFullName = "Amazon Simple Storage Service";
    s3.serviceAbbreviation = "Amazon S3";
    EXPECT_EQ(ServiceClassName(s3), "S3");

    model::ServiceMetadata ddb;
    ddb.endpointPrefix = "dynamodb";
    ddb.serviceFullName = "Amazon DynamoDB";
    EXPECT_EQ(ServiceClassName(ddb), "DynamoDB");

    model::ServiceMetadata kms;
    kms.endpointPrefix = "kms";
    kms.serviceFullName = "AWS Key Management Service";
    kms.serviceAbbreviation = "KMS";
    EXPECT_EQ(ServiceClassName(kms), "KMS");

    model::ServiceMetadata bare;
    bare.endpointPrefix = "widgets";
    EXPECT_EQ(ServiceClassName(bare), "widgets");
}

TEST(Naming, ToLower) {
    EXPECT_EQ(ToLower("HTTPS://Example.COM"), "https://example.com");
}
