#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "../path_normalizer.hpp"
#include "../store/blob_store.hpp"
#include "stored_file.hpp"
#include "stored_folder.hpp"

namespace blobfs {

struct FileSystemOptions {
    std::string container_name;
    std::string root;                                   // "" or "/" maps the whole container
    ContainerAccess access = ContainerAccess::Private;
    bool debug_mode = false;
    bool verbose_logging = false;
};

/**
 * BlobFileSystem - Hierarchical files and folders over a flat blob store
 *
 * Keys are composed as <root>/<relative path>. Folders do not exist in the
 * store: they are the common prefixes of object keys, and an otherwise
 * empty folder is kept alive by a hidden zero-byte marker object named
 * kFolderMarker directly under its prefix.
 *
 * Renames are copy-then-delete and recursive folder operations walk the
 * tree one object at a time. None of it is atomic: a failure part way
 * leaves the tree partially applied (for a file rename, possibly both the
 * source and the copy) and the error is raised to the caller. Nothing is
 * cached and nothing is locked; every call re-queries the store.
 */
class BlobFileSystem {
public:
    static constexpr const char* kFolderMarker = "$$$BLOBFS$$$.$$$";

    using FileVisitor = std::function<bool(const StoredFile&)>;

    // Binds to the container, creating it and applying options.access
    BlobFileSystem(std::shared_ptr<IBlobStore> store, const FileSystemOptions& options);

    const std::string& containerName() const { return container_; }
    const PathNormalizer& paths() const { return paths_; }

    // File operations
    bool fileExists(const std::string& path) const;
    StoredFile getFile(const std::string& path) const;
    StoredFile createFile(const std::string& path);
    void deleteFile(const std::string& path);
    void renameFile(const std::string& path, const std::string& new_path);
    std::string getPublicUrl(const std::string& path) const;

    // Relative path of an URL returned by getPublicUrl()
    std::string resolvePublicUrl(const std::string& url) const;

    // Files directly under path, folder markers excluded
    std::vector<StoredFile> listFiles(const std::string& path) const;

    // Lazy form of listFiles(); stops when the visitor returns false
    void forEachFile(const std::string& path, const FileVisitor& visitor) const;

    // Folder operations

    // Creates the folder first when nothing exists under path
    std::vector<StoredFolder> listFolders(const std::string& path);

    void createFolder(const std::string& path);
    void deleteFolder(const std::string& path);
    void renameFolder(const std::string& path, const std::string& new_path);
    bool folderExists(const std::string& path) const;
    StoredFolder getFolder(const std::string& path) const;

    // Recursive byte total; marker objects count with their zero size
    std::int64_t getFolderSize(const std::string& path) const;

    static bool isFolderMarker(const std::string& key);

    // Number of operations currently running (nested calls included)
    int activeOperations() const { return active_operations_.load(); }

private:
    std::string fileKey(const std::string& path) const;
    StoredFile makeFile(const ObjectMetadata& metadata) const;
    StoredFolder makeFolder(const std::string& prefix) const;
    std::vector<ListEntry> collectEntries(const std::string& prefix) const;

    void writeMarker(const std::string& path);
    void moveObject(const std::string& source_key, const std::string& destination_key);
    void movePrefix(const std::string& source_prefix, const std::string& destination_prefix);
    void deletePrefix(const std::string& prefix);

    std::shared_ptr<IBlobStore> store_;
    std::string container_;
    PathNormalizer paths_;
    bool debug_mode_;
    bool verbose_logging_;
    mutable std::atomic<int> active_operations_{0};
};

} // namespace blobfs
