#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace blobfs {

/**
 * ObjectMetadata - Simplified metadata for one stored object
 */
struct ObjectMetadata {
    std::string name;        // full key
    std::int64_t size = 0;
    std::chrono::system_clock::time_point updated;
};

// Common key prefix returned by a delimiter listing ("docs/")
struct PrefixEntry {
    std::string prefix;
};

// One entry of a delimiter listing: an object, or a synthesized directory
using ListEntry = std::variant<ObjectMetadata, PrefixEntry>;

// Return false to stop the enumeration
using ListVisitor = std::function<bool(const ListEntry&)>;

enum class ContainerAccess {
    Private,      // no anonymous read
    PublicRead    // anonymous read of every object in the container
};

/**
 * BlobWriteStream - Output stream that materializes an object on close
 *
 * close() commits the written bytes and throws on failure. A stream that
 * goes out of scope normally without close() commits from its destructor
 * and only logs a failure. A stream destroyed while an exception is
 * propagating abandons its bytes and leaves the stored object untouched.
 */
class BlobWriteStream : public std::ostream {
public:
    BlobWriteStream()
        : std::ostream(nullptr),
          uncaught_at_open_(std::uncaught_exceptions()) {}
    virtual ~BlobWriteStream() = default;

    virtual void close() = 0;
    virtual bool closed() const = 0;

protected:
    // True when destroyed by stack unwinding that began after the open
    bool unwinding() const {
        return std::uncaught_exceptions() > uncaught_at_open_;
    }

private:
    int uncaught_at_open_;
};

/**
 * IBlobStore - Flat, prefix-addressed object store
 *
 * Every call names its container explicitly. Missing objects are
 * reported through std::optional or NotFoundError; every other store
 * failure is raised as StoreError.
 */
class IBlobStore {
public:
    virtual ~IBlobStore() = default;

    // Backend name for logging
    virtual std::string typeName() const = 0;

    // Create the container when absent, then apply the access policy
    virtual void ensureContainer(const std::string& container, ContainerAccess access) = 0;

    // URL under which the container's objects are published
    virtual std::string baseAddress(const std::string& container) const = 0;

    virtual std::optional<ObjectMetadata> getObjectMetadata(
        const std::string& container,
        const std::string& key) const = 0;

    virtual bool objectExists(
        const std::string& container,
        const std::string& key) const
    {
        return getObjectMetadata(container, key).has_value();
    }

    // True when at least one object key starts with prefix
    virtual bool prefixExists(
        const std::string& container,
        const std::string& prefix) const = 0;

    // Lazily enumerate the direct children of prefix using '/' as delimiter
    virtual void listEntries(
        const std::string& container,
        const std::string& prefix,
        const ListVisitor& visitor) const = 0;

    virtual std::unique_ptr<std::istream> openRead(
        const std::string& container,
        const std::string& key) const = 0;

    // With if_absent the commit fails with AlreadyExistsError when the
    // key already exists
    virtual std::unique_ptr<BlobWriteStream> openWrite(
        const std::string& container,
        const std::string& key,
        bool if_absent = false) const = 0;

    // Copy fails with AlreadyExistsError when destination already exists
    virtual void copyObject(
        const std::string& container,
        const std::string& source_key,
        const std::string& destination_key) const = 0;

    virtual void deleteObject(
        const std::string& container,
        const std::string& key) const = 0;
};

} // namespace blobfs
