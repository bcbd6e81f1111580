#include "gcs_sdk_interface.hpp"

namespace blobfs {

namespace {
    gcs::IfGenerationMatch generationPrecondition(const std::optional<std::int64_t>& generation) {
        if (!generation) {
            return gcs::IfGenerationMatch();
        }
        return gcs::IfGenerationMatch(*generation);
    }

    gcs::MaxResults maxResults(int max_results) {
        if (max_results <= 0) {
            return gcs::MaxResults();
        }
        return gcs::MaxResults(max_results);
    }
}

GCSSDKClientImpl::GCSSDKClientImpl() : client_(gcs::Client()) {}

GCSSDKClientImpl::GCSSDKClientImpl(const gcs::Client& client) : client_(client) {}

gcs::ObjectReadStream GCSSDKClientImpl::ReadObject(const ReadObjectRequest& request) const {
    return client_.ReadObject(request.bucket_name, request.object_name);
}

StatusOr<gcs::ObjectMetadata> GCSSDKClientImpl::GetObjectMetadata(
    const GetObjectMetadataRequest& request) const
{
    return client_.GetObjectMetadata(request.bucket_name, request.object_name);
}

gcs::ObjectWriteStream GCSSDKClientImpl::WriteObject(const WriteObjectRequest& request) const {
    return client_.WriteObject(
        request.bucket_name,
        request.object_name,
        generationPrecondition(request.if_generation_match));
}

Status GCSSDKClientImpl::DeleteObject(const DeleteObjectRequest& request) const {
    return client_.DeleteObject(request.bucket_name, request.object_name);
}

gcs::ListObjectsReader GCSSDKClientImpl::ListObjects(const ListObjectsRequest& request) const {
    return client_.ListObjects(
        request.bucket_name,
        gcs::Prefix(request.prefix),
        gcs::Delimiter(request.delimiter),
        maxResults(request.max_results)
    );
}

gcs::ListObjectsAndPrefixesReader GCSSDKClientImpl::ListObjectsAndPrefixes(
    const ListObjectsRequest& request) const
{
    return client_.ListObjectsAndPrefixes(
        request.bucket_name,
        gcs::Prefix(request.prefix),
        gcs::Delimiter(request.delimiter),
        maxResults(request.max_results)
    );
}

StatusOr<gcs::ObjectMetadata> GCSSDKClientImpl::RewriteObject(const RewriteObjectRequest& request) const {
    return client_.RewriteObjectBlocking(
        request.bucket_name,
        request.source_object_name,
        request.bucket_name,
        request.destination_object_name,
        generationPrecondition(request.if_generation_match));
}

StatusOr<gcs::BucketMetadata> GCSSDKClientImpl::CreateBucket(const CreateBucketRequest& request) const {
    if (request.project_id.empty()) {
        return client_.CreateBucket(request.bucket_name, gcs::BucketMetadata());
    }
    return client_.CreateBucketForProject(
        request.bucket_name, request.project_id, gcs::BucketMetadata());
}

StatusOr<gcs::NativeIamPolicy> GCSSDKClientImpl::GetBucketIamPolicy(const std::string& bucket_name) const {
    return client_.GetNativeBucketIamPolicy(bucket_name);
}

StatusOr<gcs::NativeIamPolicy> GCSSDKClientImpl::SetBucketIamPolicy(
    const std::string& bucket_name,
    const gcs::NativeIamPolicy& policy) const
{
    return client_.SetNativeBucketIamPolicy(bucket_name, policy);
}

} // namespace blobfs
