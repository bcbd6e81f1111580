#pragma once

#include <string>
#include <memory>
#include "google/cloud/storage/client.h"
#include "gcs_sdk_interface.hpp"
#include "../store/blob_store.hpp"

namespace gcs = ::google::cloud::storage;

namespace blobfs {

class ConnectionString;

/**
 * GCSBlobStore - IBlobStore over Google Cloud Storage
 *
 * Buckets play the role of containers. Translates SDK statuses into the
 * adapter's exceptions: NOT_FOUND becomes NotFoundError, a failed
 * create-only precondition becomes AlreadyExistsError, anything else is a
 * StoreError. No call is retried here; the SDK client's own retry policy
 * is the only one in effect.
 *
 * Uses dependency injection with IGCSSDKClient to enable proper unit testing.
 */
class GCSBlobStore : public IBlobStore {
public:
    static constexpr const char* kDefaultEndpoint = "https://storage.googleapis.com";
    static constexpr const char* kPublicReader = "allUsers";
    static constexpr const char* kObjectViewerRole = "roles/storage.objectViewer";

    // Builds the SDK client from endpoint, project and credentials
    explicit GCSBlobStore(const ConnectionString& connection, bool debug_mode = false);
    // Constructor for dependency injection (enables mocking in tests)
    GCSBlobStore(std::unique_ptr<IGCSSDKClient> sdk_client,
                 const std::string& endpoint,
                 const std::string& project_id = "",
                 bool debug_mode = false);
    ~GCSBlobStore() override = default;

    std::string typeName() const override { return "gcs"; }

    void ensureContainer(const std::string& container, ContainerAccess access) override;

    std::string baseAddress(const std::string& container) const override;

    std::optional<ObjectMetadata> getObjectMetadata(
        const std::string& container,
        const std::string& key) const override;

    bool prefixExists(
        const std::string& container,
        const std::string& prefix) const override;

    void listEntries(
        const std::string& container,
        const std::string& prefix,
        const ListVisitor& visitor) const override;

    std::unique_ptr<std::istream> openRead(
        const std::string& container,
        const std::string& key) const override;

    std::unique_ptr<BlobWriteStream> openWrite(
        const std::string& container,
        const std::string& key,
        bool if_absent = false) const override;

    void copyObject(
        const std::string& container,
        const std::string& source_key,
        const std::string& destination_key) const override;

    void deleteObject(
        const std::string& container,
        const std::string& key) const override;

    // Raise the adapter exception matching a failed status
    [[noreturn]] static void throwStatus(const Status& status, const std::string& context);

private:
    void applyAccessPolicy(const std::string& bucket_name, ContainerAccess access) const;

    std::unique_ptr<IGCSSDKClient> sdk_client_;
    std::string endpoint_;
    std::string project_id_;
    bool debug_mode_;
};

} // namespace blobfs
