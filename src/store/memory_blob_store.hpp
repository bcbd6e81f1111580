#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include "blob_store.hpp"

namespace blobfs {

/**
 * MemoryBlobStore - In-process object store with GCS-like semantics
 *
 * Keys are flat; listing with a prefix reports direct objects and
 * '/'-delimited common prefixes. Used by the tests and by the CLI's
 * --memory-store dry-run mode.
 *
 * Faults can be injected per (operation, key) to exercise partial
 * failures of multi-step operations.
 */
class MemoryBlobStore : public IBlobStore {
public:
    enum class FaultPoint { Read, Write, Copy, Delete };

    explicit MemoryBlobStore(const std::string& base_address = "memory://");

    std::string typeName() const override { return "memory"; }

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

    // Test helpers
    void putObject(const std::string& container, const std::string& key, const std::string& content);
    std::optional<std::string> objectContent(const std::string& container, const std::string& key) const;
    std::size_t objectCount(const std::string& container) const;
    bool containerExists(const std::string& container) const;
    std::optional<ContainerAccess> containerAccess(const std::string& container) const;
    void injectFault(FaultPoint point, const std::string& key);
    void clearFaults();

    struct StoredObject {
        std::string data;
        std::chrono::system_clock::time_point updated;
    };

    struct Container {
        ContainerAccess access = ContainerAccess::Private;
        std::map<std::string, StoredObject> objects;
    };

    // Shared with open write streams so they can commit after the
    // store handle is gone
    struct State {
        std::mutex mutex;
        std::map<std::string, Container> containers;
        std::set<std::pair<FaultPoint, std::string>> faults;
    };

private:
    std::shared_ptr<State> state_;
    std::string base_address_;
};

} // namespace blobfs
