#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include "google/cloud/storage/client.h"
#include "google/cloud/status.h"
#include "google/cloud/status_or.h"

namespace gcs = ::google::cloud::storage;
using google::cloud::Status;
using google::cloud::StatusOr;

namespace blobfs {

/**
 * Raw interface wrapper for GCS SDK - minimal logic, just exposes SDK types
 * This allows mocking the SDK in tests while GCSBlobStore contains the business logic
 */
class IGCSSDKClient {
public:
    virtual ~IGCSSDKClient() = default;

    struct ReadObjectRequest {
        std::string bucket_name;
        std::string object_name;

        bool operator==(const ReadObjectRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name;
        }
    };

    struct GetObjectMetadataRequest {
        std::string bucket_name;
        std::string object_name;

        bool operator==(const GetObjectMetadataRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name;
        }
    };

    struct WriteObjectRequest {
        std::string bucket_name;
        std::string object_name;
        // 0 means "only create": the upload fails if the object exists
        std::optional<std::int64_t> if_generation_match;

        bool operator==(const WriteObjectRequest& other) const {
            return bucket_name == other.bucket_name &&
                   object_name == other.object_name &&
                   if_generation_match == other.if_generation_match;
        }
    };

    struct DeleteObjectRequest {
        std::string bucket_name;
        std::string object_name;

        bool operator==(const DeleteObjectRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name;
        }
    };

    struct ListObjectsRequest {
        std::string bucket_name;
        std::string prefix;
        std::string delimiter;
        int max_results = 0;

        bool operator==(const ListObjectsRequest& other) const {
            return bucket_name == other.bucket_name &&
                   prefix == other.prefix &&
                   delimiter == other.delimiter &&
                   max_results == other.max_results;
        }
    };

    struct RewriteObjectRequest {
        std::string bucket_name;
        std::string source_object_name;
        std::string destination_object_name;
        std::optional<std::int64_t> if_generation_match;

        bool operator==(const RewriteObjectRequest& other) const {
            return bucket_name == other.bucket_name &&
                   source_object_name == other.source_object_name &&
                   destination_object_name == other.destination_object_name &&
                   if_generation_match == other.if_generation_match;
        }
    };

    struct CreateBucketRequest {
        std::string bucket_name;
        std::string project_id;   // empty: project from client options

        bool operator==(const CreateBucketRequest& other) const {
            return bucket_name == other.bucket_name && project_id == other.project_id;
        }
    };

    // Read object - returns SDK's ObjectReadStream
    virtual gcs::ObjectReadStream ReadObject(const ReadObjectRequest& request) const = 0;

    virtual StatusOr<gcs::ObjectMetadata> GetObjectMetadata(const GetObjectMetadataRequest& request) const = 0;

    // Write object - returns SDK's ObjectWriteStream
    virtual gcs::ObjectWriteStream WriteObject(const WriteObjectRequest& request) const = 0;

    virtual Status DeleteObject(const DeleteObjectRequest& request) const = 0;

    // Objects only, no common prefixes
    virtual gcs::ListObjectsReader ListObjects(const ListObjectsRequest& request) const = 0;

    // Objects and '/'-delimited common prefixes
    virtual gcs::ListObjectsAndPrefixesReader ListObjectsAndPrefixes(const ListObjectsRequest& request) const = 0;

    // Server-side copy inside one bucket
    virtual StatusOr<gcs::ObjectMetadata> RewriteObject(const RewriteObjectRequest& request) const = 0;

    virtual StatusOr<gcs::BucketMetadata> CreateBucket(const CreateBucketRequest& request) const = 0;

    virtual StatusOr<gcs::NativeIamPolicy> GetBucketIamPolicy(const std::string& bucket_name) const = 0;

    virtual StatusOr<gcs::NativeIamPolicy> SetBucketIamPolicy(
        const std::string& bucket_name,
        const gcs::NativeIamPolicy& policy) const = 0;
};

/**
 * Real implementation - thin wrapper over google::cloud::storage::Client
 * Just forwards calls to the SDK with no business logic
 */
class GCSSDKClientImpl : public IGCSSDKClient {
public:
    GCSSDKClientImpl();
    explicit GCSSDKClientImpl(const gcs::Client& client);

    gcs::ObjectReadStream ReadObject(const ReadObjectRequest& request) const override;

    StatusOr<gcs::ObjectMetadata> GetObjectMetadata(const GetObjectMetadataRequest& request) const override;

    gcs::ObjectWriteStream WriteObject(const WriteObjectRequest& request) const override;

    Status DeleteObject(const DeleteObjectRequest& request) const override;

    gcs::ListObjectsReader ListObjects(const ListObjectsRequest& request) const override;

    gcs::ListObjectsAndPrefixesReader ListObjectsAndPrefixes(const ListObjectsRequest& request) const override;

    StatusOr<gcs::ObjectMetadata> RewriteObject(const RewriteObjectRequest& request) const override;

    StatusOr<gcs::BucketMetadata> CreateBucket(const CreateBucketRequest& request) const override;

    StatusOr<gcs::NativeIamPolicy> GetBucketIamPolicy(const std::string& bucket_name) const override;

    StatusOr<gcs::NativeIamPolicy> SetBucketIamPolicy(
        const std::string& bucket_name,
        const gcs::NativeIamPolicy& policy) const override;

private:
    mutable gcs::Client client_;
};

} // namespace blobfs
