#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include "../store/blob_store.hpp"

namespace blobfs {

/**
 * StoredFile - Handle to one object in the store
 *
 * size() and lastUpdated() report what the store returned when the handle
 * was produced; openRead() and openWrite() always go to the live object.
 */
class StoredFile {
public:
    StoredFile(std::shared_ptr<const IBlobStore> store,
               std::string container,
               std::string path,
               ObjectMetadata metadata);

    // Path relative to the file system root
    const std::string& path() const { return path_; }
    const std::string& key() const { return metadata_.name; }
    std::string name() const;
    std::int64_t size() const { return metadata_.size; }
    std::chrono::system_clock::time_point lastUpdated() const { return metadata_.updated; }

    // Extension including the dot ("" when none)
    std::string fileType() const;

    std::unique_ptr<std::istream> openRead() const;

    // Replaces the object's content once the stream is closed
    std::unique_ptr<BlobWriteStream> openWrite() const;

    std::string readAll() const;
    void writeAll(const std::string& content) const;

private:
    std::shared_ptr<const IBlobStore> store_;
    std::string container_;
    std::string path_;
    ObjectMetadata metadata_;
};

} // namespace blobfs
