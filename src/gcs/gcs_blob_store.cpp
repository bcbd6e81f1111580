#include "gcs_blob_store.hpp"
#include "../connection_string.hpp"
#include "../errors.hpp"
#include "absl/types/variant.h"
#include "google/cloud/credentials.h"
#include "google/cloud/storage/options.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace blobfs {

using google::cloud::StatusCode;

namespace {
    std::string endpointOf(const ConnectionString& connection) {
        if (connection.endpoint().empty()) {
            return GCSBlobStore::kDefaultEndpoint;
        }
        return connection.endpoint();
    }

    google::cloud::Options makeClientOptions(const ConnectionString& connection) {
        google::cloud::Options options;
        options.set<gcs::RestEndpointOption>(endpointOf(connection));

        if (!connection.projectId().empty()) {
            options.set<gcs::ProjectIdOption>(connection.projectId());
        }

        if (connection.anonymous()) {
            options.set<google::cloud::UnifiedCredentialsOption>(
                google::cloud::MakeInsecureCredentials());
        } else if (!connection.credentialsFile().empty()) {
            std::ifstream file(connection.credentialsFile());
            if (!file) {
                throw std::runtime_error("Cannot read credentials file: " + connection.credentialsFile());
            }
            std::string contents{std::istreambuf_iterator<char>{file}, {}};
            options.set<google::cloud::UnifiedCredentialsOption>(
                google::cloud::MakeServiceAccountCredentials(contents));
        }

        return options;
    }

    ObjectMetadata toObjectMetadata(const gcs::ObjectMetadata& metadata) {
        ObjectMetadata obj_meta;
        obj_meta.name = metadata.name();
        obj_meta.size = static_cast<std::int64_t>(metadata.size());
        obj_meta.updated = metadata.updated();
        return obj_meta;
    }

    // A create-only precondition (ifGenerationMatch=0) failing means the
    // object was already there
    [[noreturn]] void throwWriteStatus(const Status& status, const std::string& key, bool if_absent) {
        if (if_absent && status.code() == StatusCode::kFailedPrecondition) {
            throw AlreadyExistsError("Object already exists: " + key);
        }
        GCSBlobStore::throwStatus(status, "Writing " + key);
    }

    /**
     * GCSWriteStream - BlobWriteStream over the SDK's resumable upload
     *
     * Shares the SDK stream's buffer so bytes go straight to the upload.
     */
    class GCSWriteStream : public BlobWriteStream {
    public:
        GCSWriteStream(gcs::ObjectWriteStream writer, std::string key, bool if_absent)
            : writer_(std::move(writer)),
              key_(std::move(key)),
              if_absent_(if_absent) {
            rdbuf(writer_.rdbuf());
        }

        ~GCSWriteStream() override {
            if (closed_) {
                return;
            }
            if (unwinding()) {
                // Leave the resumable session unfinalized so the object keeps its old content
                std::cerr << "[WARN] Abandoning unfinished upload of " << key_ << std::endl;
                rdbuf(nullptr);
                std::move(writer_).Suspend();
                return;
            }
            try {
                close();
            } catch (const FileSystemError& e) {
                std::cerr << "[WARN] Upload of " << key_ << " failed: " << e.what() << std::endl;
            }
        }

        void close() override {
            if (closed_) {
                return;
            }
            closed_ = true;
            writer_.Close();

            const auto& metadata = writer_.metadata();
            if (!metadata) {
                throwWriteStatus(metadata.status(), key_, if_absent_);
            }
        }

        bool closed() const override { return closed_; }

    private:
        gcs::ObjectWriteStream writer_;
        std::string key_;
        bool if_absent_;
        bool closed_ = false;
    };
}

GCSBlobStore::GCSBlobStore(const ConnectionString& connection, bool debug_mode)
    : GCSBlobStore(
          std::make_unique<GCSSDKClientImpl>(gcs::Client(makeClientOptions(connection))),
          endpointOf(connection),
          connection.projectId(),
          debug_mode)
{
    if (debug_mode_) {
        std::cout << "[DEBUG] GCS client: " << connection.describe() << std::endl;
    }
}

GCSBlobStore::GCSBlobStore(std::unique_ptr<IGCSSDKClient> sdk_client,
                           const std::string& endpoint,
                           const std::string& project_id,
                           bool debug_mode)
    : sdk_client_(std::move(sdk_client)),
      endpoint_(endpoint),
      project_id_(project_id),
      debug_mode_(debug_mode)
{
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
}

void GCSBlobStore::throwStatus(const Status& status, const std::string& context) {
    std::ostringstream message;
    message << context << ": " << status.message();

    switch (status.code()) {
        case StatusCode::kNotFound:
            throw NotFoundError(message.str());
        case StatusCode::kAlreadyExists:
            throw AlreadyExistsError(message.str());
        default: {
            std::ostringstream detailed;
            detailed << context << ": " << status;
            throw StoreError(detailed.str());
        }
    }
}

void GCSBlobStore::ensureContainer(const std::string& container, ContainerAccess access) {
    IGCSSDKClient::CreateBucketRequest request;
    request.bucket_name = container;
    request.project_id = project_id_;

    auto created = sdk_client_->CreateBucket(request);
    if (created) {
        if (debug_mode_) {
            std::cout << "[DEBUG] Created bucket: " << container << std::endl;
        }
    } else if (created.status().code() == StatusCode::kAlreadyExists) {
        if (debug_mode_) {
            std::cout << "[DEBUG] Bucket already exists: " << container << std::endl;
        }
    } else {
        throwStatus(created.status(), "Creating bucket " + container);
    }

    applyAccessPolicy(container, access);
}

void GCSBlobStore::applyAccessPolicy(const std::string& bucket_name, ContainerAccess access) const {
    auto policy = sdk_client_->GetBucketIamPolicy(bucket_name);
    if (!policy) {
        throwStatus(policy.status(), "Reading IAM policy of " + bucket_name);
    }

    auto& bindings = policy->bindings();
    bool changed = false;

    if (access == ContainerAccess::PublicRead) {
        auto viewer = std::find_if(bindings.begin(), bindings.end(),
            [](const gcs::NativeIamBinding& binding) { return binding.role() == kObjectViewerRole; });

        if (viewer == bindings.end()) {
            bindings.emplace_back(kObjectViewerRole, std::vector<std::string>{kPublicReader});
            changed = true;
        } else {
            auto& members = viewer->members();
            if (std::find(members.begin(), members.end(), kPublicReader) == members.end()) {
                members.emplace_back(kPublicReader);
                changed = true;
            }
        }
    } else {
        for (auto& binding : bindings) {
            auto& members = binding.members();
            auto public_member = std::remove(members.begin(), members.end(), kPublicReader);
            if (public_member != members.end()) {
                members.erase(public_member, members.end());
                changed = true;
            }
        }
        bindings.erase(
            std::remove_if(bindings.begin(), bindings.end(),
                [](const gcs::NativeIamBinding& binding) { return binding.members().empty(); }),
            bindings.end());
    }

    if (!changed) {
        if (debug_mode_) {
            std::cout << "[DEBUG] Access policy of " << bucket_name << " already up to date" << std::endl;
        }
        return;
    }

    auto updated = sdk_client_->SetBucketIamPolicy(bucket_name, *policy);
    if (!updated) {
        throwStatus(updated.status(), "Updating IAM policy of " + bucket_name);
    }

    if (debug_mode_) {
        std::cout << "[DEBUG] Bucket " << bucket_name << " is now "
                  << (access == ContainerAccess::PublicRead ? "public-read" : "private") << std::endl;
    }
}

std::string GCSBlobStore::baseAddress(const std::string& container) const {
    return endpoint_ + "/" + container;
}

std::optional<ObjectMetadata> GCSBlobStore::getObjectMetadata(
    const std::string& container,
    const std::string& key) const
{
    IGCSSDKClient::GetObjectMetadataRequest request;
    request.bucket_name = container;
    request.object_name = key;

    auto metadata = sdk_client_->GetObjectMetadata(request);
    if (!metadata) {
        if (metadata.status().code() == StatusCode::kNotFound) {
            return std::nullopt;
        }
        throwStatus(metadata.status(), "Getting metadata for " + key);
    }

    return toObjectMetadata(*metadata);
}

bool GCSBlobStore::prefixExists(
    const std::string& container,
    const std::string& prefix) const
{
    IGCSSDKClient::ListObjectsRequest request;
    request.bucket_name = container;
    request.prefix = prefix;
    request.max_results = 1;

    for (auto&& object_metadata : sdk_client_->ListObjects(request)) {
        if (!object_metadata) {
            throwStatus(object_metadata.status(), "Checking prefix " + prefix);
        }
        return true;
    }
    return false;
}

void GCSBlobStore::listEntries(
    const std::string& container,
    const std::string& prefix,
    const ListVisitor& visitor) const
{
    IGCSSDKClient::ListObjectsRequest request;
    request.bucket_name = container;
    request.prefix = prefix;
    request.delimiter = "/";

    if (debug_mode_) {
        std::cout << "[DEBUG] Listing gs://" << container << "/" << prefix << std::endl;
    }

    for (auto&& item : sdk_client_->ListObjectsAndPrefixes(request)) {
        if (!item) {
            throwStatus(item.status(), "Listing " + prefix);
        }

        ListEntry entry;
        if (absl::holds_alternative<gcs::ObjectMetadata>(*item)) {
            entry = toObjectMetadata(absl::get<gcs::ObjectMetadata>(*item));
        } else {
            entry = PrefixEntry{absl::get<std::string>(*item)};
        }

        if (!visitor(entry)) {
            break;
        }
    }
}

std::unique_ptr<std::istream> GCSBlobStore::openRead(
    const std::string& container,
    const std::string& key) const
{
    IGCSSDKClient::ReadObjectRequest request;
    request.bucket_name = container;
    request.object_name = key;

    auto reader = std::make_unique<gcs::ObjectReadStream>(sdk_client_->ReadObject(request));
    if (!reader->status().ok()) {
        throwStatus(reader->status(), "Reading " + key);
    }
    if (!*reader) {
        throw StoreError("Reading " + key + ": stream is not readable");
    }
    return reader;
}

std::unique_ptr<BlobWriteStream> GCSBlobStore::openWrite(
    const std::string& container,
    const std::string& key,
    bool if_absent) const
{
    IGCSSDKClient::WriteObjectRequest request;
    request.bucket_name = container;
    request.object_name = key;
    if (if_absent) {
        request.if_generation_match = 0;
    }

    auto writer = sdk_client_->WriteObject(request);
    if (!writer.IsOpen() && !writer.metadata()) {
        throwWriteStatus(writer.metadata().status(), key, if_absent);
    }

    return std::make_unique<GCSWriteStream>(std::move(writer), key, if_absent);
}

void GCSBlobStore::copyObject(
    const std::string& container,
    const std::string& source_key,
    const std::string& destination_key) const
{
    IGCSSDKClient::RewriteObjectRequest request;
    request.bucket_name = container;
    request.source_object_name = source_key;
    request.destination_object_name = destination_key;
    request.if_generation_match = 0;

    auto copied = sdk_client_->RewriteObject(request);
    if (!copied) {
        if (copied.status().code() == StatusCode::kFailedPrecondition) {
            throw AlreadyExistsError("Object already exists: " + destination_key);
        }
        throwStatus(copied.status(), "Copying " + source_key + " to " + destination_key);
    }
}

void GCSBlobStore::deleteObject(
    const std::string& container,
    const std::string& key) const
{
    IGCSSDKClient::DeleteObjectRequest request;
    request.bucket_name = container;
    request.object_name = key;

    auto status = sdk_client_->DeleteObject(request);
    if (!status.ok()) {
        throwStatus(status, "Deleting " + key);
    }
}

} // namespace blobfs
