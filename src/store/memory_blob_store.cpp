#include "memory_blob_store.hpp"
#include "../errors.hpp"
#include <iostream>
#include <sstream>
#include <vector>

namespace blobfs {

namespace {
    using State = MemoryBlobStore::State;
    using FaultPoint = MemoryBlobStore::FaultPoint;

    const char* faultName(FaultPoint point) {
        switch (point) {
            case FaultPoint::Read:   return "read";
            case FaultPoint::Write:  return "write";
            case FaultPoint::Copy:   return "copy";
            case FaultPoint::Delete: return "delete";
        }
        return "unknown";
    }

    // Caller holds state.mutex
    void checkFault(const State& state, FaultPoint point, const std::string& key) {
        if (state.faults.count({point, key}) > 0) {
            throw StoreError(std::string("Injected ") + faultName(point) + " failure for " + key);
        }
    }

    // Caller holds state.mutex
    MemoryBlobStore::Container& requireContainer(State& state, const std::string& container) {
        auto it = state.containers.find(container);
        if (it == state.containers.end()) {
            throw NotFoundError("Container not found: " + container);
        }
        return it->second;
    }

    bool startsWith(const std::string& value, const std::string& prefix) {
        return value.size() >= prefix.size() &&
               value.compare(0, prefix.size(), prefix) == 0;
    }

    void commitObject(State& state,
                      const std::string& container,
                      const std::string& key,
                      std::string data,
                      bool if_absent) {
        std::lock_guard<std::mutex> lock(state.mutex);
        checkFault(state, FaultPoint::Write, key);

        auto& objects = requireContainer(state, container).objects;
        if (if_absent && objects.count(key) > 0) {
            throw AlreadyExistsError("Object already exists: " + key);
        }

        auto& object = objects[key];
        object.data = std::move(data);
        object.updated = std::chrono::system_clock::now();
    }

    class MemoryWriteStream : public BlobWriteStream {
    public:
        MemoryWriteStream(std::shared_ptr<State> state,
                          std::string container,
                          std::string key,
                          bool if_absent)
            : state_(std::move(state)),
              container_(std::move(container)),
              key_(std::move(key)),
              if_absent_(if_absent) {
            rdbuf(&buffer_);
        }

        ~MemoryWriteStream() override {
            if (closed_) {
                return;
            }
            if (unwinding()) {
                std::cerr << "[WARN] Discarding unfinished write of " << key_ << std::endl;
                return;
            }
            try {
                close();
            } catch (const FileSystemError& e) {
                std::cerr << "[WARN] Commit of " << key_ << " failed: " << e.what() << std::endl;
            }
        }

        void close() override {
            if (closed_) {
                return;
            }
            closed_ = true;
            flush();
            commitObject(*state_, container_, key_, buffer_.str(), if_absent_);
        }

        bool closed() const override { return closed_; }

    private:
        std::shared_ptr<State> state_;
        std::string container_;
        std::string key_;
        bool if_absent_;
        std::stringbuf buffer_;
        bool closed_ = false;
    };
}

MemoryBlobStore::MemoryBlobStore(const std::string& base_address)
    : state_(std::make_shared<State>()),
      base_address_(base_address) {}

void MemoryBlobStore::ensureContainer(const std::string& container, ContainerAccess access) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    // operator[] keeps existing objects: creation is idempotent
    state_->containers[container].access = access;
}

std::string MemoryBlobStore::baseAddress(const std::string& container) const {
    return base_address_ + container;
}

std::optional<ObjectMetadata> MemoryBlobStore::getObjectMetadata(
    const std::string& container,
    const std::string& key) const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    const auto& objects = requireContainer(*state_, container).objects;

    auto it = objects.find(key);
    if (it == objects.end()) {
        return std::nullopt;
    }

    ObjectMetadata metadata;
    metadata.name = it->first;
    metadata.size = static_cast<std::int64_t>(it->second.data.size());
    metadata.updated = it->second.updated;
    return metadata;
}

bool MemoryBlobStore::prefixExists(
    const std::string& container,
    const std::string& prefix) const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    const auto& objects = requireContainer(*state_, container).objects;

    auto it = objects.lower_bound(prefix);
    return it != objects.end() && startsWith(it->first, prefix);
}

void MemoryBlobStore::listEntries(
    const std::string& container,
    const std::string& prefix,
    const ListVisitor& visitor) const
{
    std::vector<ListEntry> entries;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        const auto& objects = requireContainer(*state_, container).objects;

        std::set<std::string> seen_prefixes;
        for (auto it = objects.lower_bound(prefix);
             it != objects.end() && startsWith(it->first, prefix); ++it) {
            std::string relative = it->first.substr(prefix.size());
            size_t slash = relative.find('/');

            if (slash == std::string::npos) {
                ObjectMetadata metadata;
                metadata.name = it->first;
                metadata.size = static_cast<std::int64_t>(it->second.data.size());
                metadata.updated = it->second.updated;
                entries.emplace_back(std::move(metadata));
                continue;
            }

            std::string child_prefix = prefix + relative.substr(0, slash + 1);
            if (seen_prefixes.insert(child_prefix).second) {
                entries.emplace_back(PrefixEntry{child_prefix});
            }
        }
    }

    // Visit outside the lock so visitors may call back into the store
    for (const auto& entry : entries) {
        if (!visitor(entry)) {
            break;
        }
    }
}

std::unique_ptr<std::istream> MemoryBlobStore::openRead(
    const std::string& container,
    const std::string& key) const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    checkFault(*state_, FaultPoint::Read, key);

    const auto& objects = requireContainer(*state_, container).objects;
    auto it = objects.find(key);
    if (it == objects.end()) {
        throw NotFoundError("Object not found: " + key);
    }
    return std::make_unique<std::istringstream>(it->second.data);
}

std::unique_ptr<BlobWriteStream> MemoryBlobStore::openWrite(
    const std::string& container,
    const std::string& key,
    bool if_absent) const
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        requireContainer(*state_, container);
    }
    return std::make_unique<MemoryWriteStream>(state_, container, key, if_absent);
}

void MemoryBlobStore::copyObject(
    const std::string& container,
    const std::string& source_key,
    const std::string& destination_key) const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    checkFault(*state_, FaultPoint::Copy, source_key);

    auto& objects = requireContainer(*state_, container).objects;
    auto source = objects.find(source_key);
    if (source == objects.end()) {
        throw NotFoundError("Object not found: " + source_key);
    }
    if (objects.count(destination_key) > 0) {
        throw AlreadyExistsError("Object already exists: " + destination_key);
    }

    StoredObject copy;
    copy.data = source->second.data;
    copy.updated = std::chrono::system_clock::now();
    objects.emplace(destination_key, std::move(copy));
}

void MemoryBlobStore::deleteObject(
    const std::string& container,
    const std::string& key) const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    checkFault(*state_, FaultPoint::Delete, key);

    auto& objects = requireContainer(*state_, container).objects;
    if (objects.erase(key) == 0) {
        throw NotFoundError("Object not found: " + key);
    }
}

void MemoryBlobStore::putObject(
    const std::string& container,
    const std::string& key,
    const std::string& content)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& object = state_->containers[container].objects[key];
    object.data = content;
    object.updated = std::chrono::system_clock::now();
}

std::optional<std::string> MemoryBlobStore::objectContent(
    const std::string& container,
    const std::string& key) const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto container_it = state_->containers.find(container);
    if (container_it == state_->containers.end()) {
        return std::nullopt;
    }
    auto it = container_it->second.objects.find(key);
    if (it == container_it->second.objects.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

std::size_t MemoryBlobStore::objectCount(const std::string& container) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->containers.find(container);
    return it == state_->containers.end() ? 0 : it->second.objects.size();
}

bool MemoryBlobStore::containerExists(const std::string& container) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->containers.count(container) > 0;
}

std::optional<ContainerAccess> MemoryBlobStore::containerAccess(const std::string& container) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->containers.find(container);
    if (it == state_->containers.end()) {
        return std::nullopt;
    }
    return it->second.access;
}

void MemoryBlobStore::injectFault(FaultPoint point, const std::string& key) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->faults.emplace(point, key);
}

void MemoryBlobStore::clearFaults() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->faults.clear();
}

} // namespace blobfs
