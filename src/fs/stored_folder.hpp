#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "../path_normalizer.hpp"
#include "../store/blob_store.hpp"

namespace blobfs {

/**
 * StoredFolder - Handle to a key prefix treated as a folder
 *
 * Stores keep no directory metadata: size() walks every object under the
 * prefix on each call and lastUpdated() is always time_point::min().
 */
class StoredFolder {
public:
    StoredFolder(std::shared_ptr<const IBlobStore> store,
                 std::string container,
                 PathNormalizer paths,
                 std::string path);

    // Path relative to the file system root, "" for the root itself
    const std::string& path() const { return path_; }
    std::string name() const;
    bool isRoot() const { return path_.empty(); }

    // Sum of the sizes of every object below this folder, at any depth
    std::int64_t size() const;

    std::chrono::system_clock::time_point lastUpdated() const {
        return std::chrono::system_clock::time_point::min();
    }

    // Throws NotFoundError for the root folder
    StoredFolder parent() const;

    // Recursive size of every object under prefix
    static std::int64_t aggregateSize(const IBlobStore& store,
                                      const std::string& container,
                                      const std::string& prefix);

private:
    std::shared_ptr<const IBlobStore> store_;
    std::string container_;
    PathNormalizer paths_;
    std::string path_;
};

} // namespace blobfs
