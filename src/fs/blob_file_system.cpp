#include "blob_file_system.hpp"
#include "../errors.hpp"
#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <variant>

namespace blobfs {

namespace {
    // RAII helper that tracks operation depth and, in debug mode, traces
    // entry, exit and duration of every public operation
    class OperationScope {
        std::atomic<int>& depth_;
        bool debug_;
        const char* operation_;
        std::string path_;
        std::chrono::steady_clock::time_point start_;
        int uncaught_;

        static std::string indent(int depth) {
            return std::string(static_cast<size_t>(depth > 0 ? depth - 1 : 0) * 2, ' ');
        }

    public:
        OperationScope(std::atomic<int>& depth, bool debug, const char* operation, const std::string& path)
            : depth_(depth),
              debug_(debug),
              operation_(operation),
              path_(path),
              start_(std::chrono::steady_clock::now()),
              uncaught_(std::uncaught_exceptions()) {
            int current = ++depth_;
            if (debug_) {
                std::cout << "[DEBUG] " << indent(current) << "> " << operation_ << " '" << path_ << "'" << std::endl;
            }
        }

        ~OperationScope() {
            int current = depth_--;
            if (debug_) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_).count();
                bool failed = std::uncaught_exceptions() > uncaught_;
                std::cout << "[DEBUG] " << indent(current) << "< " << operation_ << " '" << path_ << "'"
                          << (failed ? " FAILED" : "") << " (" << elapsed << " ms)" << std::endl;
            }
        }

        OperationScope(const OperationScope&) = delete;
        OperationScope& operator=(const OperationScope&) = delete;
    };

    std::shared_ptr<IBlobStore> requireStore(std::shared_ptr<IBlobStore> store) {
        if (!store) {
            throw std::invalid_argument("BlobFileSystem requires a blob store");
        }
        return store;
    }

    bool isInside(const std::string& path, const std::string& folder) {
        return folder.empty() ||
               (path.size() > folder.size() &&
                path.compare(0, folder.size(), folder) == 0 &&
                path[folder.size()] == '/');
    }
}

BlobFileSystem::BlobFileSystem(std::shared_ptr<IBlobStore> store, const FileSystemOptions& options)
    : store_(requireStore(std::move(store))),
      container_(options.container_name),
      paths_(options.root, store_->baseAddress(options.container_name)),
      debug_mode_(options.debug_mode),
      verbose_logging_(options.verbose_logging)
{
    if (container_.empty()) {
        throw std::invalid_argument("BlobFileSystem requires a container name");
    }

    if (verbose_logging_ || debug_mode_) {
        std::cout << "Initializing blob file system for container: " << container_
                  << " (" << store_->typeName() << " store, root '" << paths_.root() << "')" << std::endl;
    }

    OperationScope scope(active_operations_, debug_mode_, "bindContainer", container_);
    store_->ensureContainer(container_, options.access);
}

// ==================== File Operations ====================

bool BlobFileSystem::fileExists(const std::string& path) const {
    OperationScope scope(active_operations_, debug_mode_, "fileExists", path);
    return store_->objectExists(container_, fileKey(path));
}

StoredFile BlobFileSystem::getFile(const std::string& path) const {
    OperationScope scope(active_operations_, debug_mode_, "getFile", path);

    auto metadata = store_->getObjectMetadata(container_, fileKey(path));
    if (!metadata) {
        throw NotFoundError("File " + path + " does not exist");
    }
    return makeFile(*metadata);
}

StoredFile BlobFileSystem::createFile(const std::string& path) {
    OperationScope scope(active_operations_, debug_mode_, "createFile", path);

    std::string key = fileKey(path);
    if (store_->objectExists(container_, key)) {
        throw AlreadyExistsError("File " + path + " already exists");
    }

    // An empty, immediately closed write materializes the object
    store_->openWrite(container_, key, true)->close();

    ObjectMetadata metadata;
    metadata.name = key;
    metadata.size = 0;
    metadata.updated = std::chrono::system_clock::now();

    if (verbose_logging_) {
        std::cout << "Created " << key << std::endl;
    }
    return makeFile(metadata);
}

void BlobFileSystem::deleteFile(const std::string& path) {
    OperationScope scope(active_operations_, debug_mode_, "deleteFile", path);

    std::string key = fileKey(path);
    if (!store_->objectExists(container_, key)) {
        throw NotFoundError("File " + path + " does not exist");
    }

    store_->deleteObject(container_, key);

    if (verbose_logging_) {
        std::cout << "Deleted " << key << std::endl;
    }
}

void BlobFileSystem::renameFile(const std::string& path, const std::string& new_path) {
    OperationScope scope(active_operations_, debug_mode_, "renameFile", path + " -> " + new_path);

    std::string source_key = fileKey(path);
    std::string destination_key = fileKey(new_path);

    if (!store_->objectExists(container_, source_key)) {
        throw NotFoundError("File " + path + " does not exist");
    }
    if (store_->objectExists(container_, destination_key)) {
        throw AlreadyExistsError("File " + new_path + " already exists");
    }

    moveObject(source_key, destination_key);
}

std::string BlobFileSystem::getPublicUrl(const std::string& path) const {
    OperationScope scope(active_operations_, debug_mode_, "getPublicUrl", path);

    if (!store_->objectExists(container_, fileKey(path))) {
        throw NotFoundError("File " + path + " does not exist");
    }
    return paths_.toPublicUrl(path);
}

std::string BlobFileSystem::resolvePublicUrl(const std::string& url) const {
    return paths_.fromPublicUrl(url);
}

std::vector<StoredFile> BlobFileSystem::listFiles(const std::string& path) const {
    std::vector<StoredFile> files;
    forEachFile(path, [&files](const StoredFile& file) {
        files.push_back(file);
        return true;
    });
    return files;
}

void BlobFileSystem::forEachFile(const std::string& path, const FileVisitor& visitor) const {
    OperationScope scope(active_operations_, debug_mode_, "listFiles", path);

    std::string prefix = paths_.folderPrefix(path);
    store_->listEntries(container_, prefix, [&](const ListEntry& entry) {
        const auto* object = std::get_if<ObjectMetadata>(&entry);
        if (object == nullptr) {
            return true;
        }
        // Skip folder markers and "name/" placeholders written by other tools
        if (isFolderMarker(object->name) || object->name.back() == '/') {
            return true;
        }
        return visitor(makeFile(*object));
    });
}

// ==================== Folder Operations ====================

std::vector<StoredFolder> BlobFileSystem::listFolders(const std::string& path) {
    OperationScope scope(active_operations_, debug_mode_, "listFolders", path);

    std::string prefix = paths_.folderPrefix(path);

    if (!store_->prefixExists(container_, prefix)) {
        if (debug_mode_) {
            std::cout << "[DEBUG] Folder '" << path << "' does not exist, creating it" << std::endl;
        }
        try {
            writeMarker(path);
        } catch (const AlreadyExistsError&) {
            // Created concurrently: the folder exists either way
            if (debug_mode_) {
                std::cout << "[DEBUG] Folder '" << path << "' appeared while creating it" << std::endl;
            }
        }
    }

    std::vector<StoredFolder> folders;
    store_->listEntries(container_, prefix, [&](const ListEntry& entry) {
        const auto* directory = std::get_if<PrefixEntry>(&entry);
        // "docs//" comes from keys with an empty segment and names no folder
        if (directory && directory->prefix.size() > prefix.size() + 1) {
            folders.push_back(makeFolder(directory->prefix));
        }
        return true;
    });
    return folders;
}

void BlobFileSystem::createFolder(const std::string& path) {
    OperationScope scope(active_operations_, debug_mode_, "createFolder", path);

    if (store_->prefixExists(container_, paths_.folderPrefix(path))) {
        throw AlreadyExistsError("Folder " + path + " already exists");
    }
    writeMarker(path);
}

void BlobFileSystem::deleteFolder(const std::string& path) {
    OperationScope scope(active_operations_, debug_mode_, "deleteFolder", path);

    std::string prefix = paths_.folderPrefix(path);
    if (!store_->prefixExists(container_, prefix)) {
        throw NotFoundError("Folder " + path + " does not exist");
    }

    deletePrefix(prefix);

    if (verbose_logging_) {
        std::cout << "Deleted folder " << path << std::endl;
    }
}

void BlobFileSystem::renameFolder(const std::string& path, const std::string& new_path) {
    OperationScope scope(active_operations_, debug_mode_, "renameFolder", path + " -> " + new_path);

    std::string source_prefix = paths_.folderPrefix(path);
    std::string destination_prefix = paths_.folderPrefix(new_path);

    std::string source = PathNormalizer::trimSlashes(path);
    std::string destination = PathNormalizer::trimSlashes(new_path);
    if (source.empty()) {
        throw InvalidPathError("The root folder cannot be renamed");
    }
    if (source == destination || isInside(destination, source)) {
        throw InvalidPathError("Cannot move folder " + path + " into itself (" + new_path + ")");
    }

    if (!store_->prefixExists(container_, source_prefix)) {
        throw NotFoundError("Folder " + path + " does not exist");
    }

    movePrefix(source_prefix, destination_prefix);

    if (verbose_logging_) {
        std::cout << "Renamed folder " << path << " to " << new_path << std::endl;
    }
}

bool BlobFileSystem::folderExists(const std::string& path) const {
    OperationScope scope(active_operations_, debug_mode_, "folderExists", path);
    return store_->prefixExists(container_, paths_.folderPrefix(path));
}

StoredFolder BlobFileSystem::getFolder(const std::string& path) const {
    if (!folderExists(path)) {
        throw NotFoundError("Folder " + path + " does not exist");
    }
    return StoredFolder(store_, container_, paths_, path);
}

std::int64_t BlobFileSystem::getFolderSize(const std::string& path) const {
    OperationScope scope(active_operations_, debug_mode_, "getFolderSize", path);
    return StoredFolder::aggregateSize(*store_, container_, paths_.folderPrefix(path));
}

bool BlobFileSystem::isFolderMarker(const std::string& key) {
    return PathNormalizer::nameOf(key) == kFolderMarker;
}

// ==================== Helpers ====================

std::string BlobFileSystem::fileKey(const std::string& path) const {
    if (PathNormalizer::trimSlashes(path).empty()) {
        throw InvalidPathError("File path must not be empty");
    }
    return paths_.toKey(path);
}

StoredFile BlobFileSystem::makeFile(const ObjectMetadata& metadata) const {
    return StoredFile(store_, container_, paths_.toRelative(metadata.name), metadata);
}

StoredFolder BlobFileSystem::makeFolder(const std::string& prefix) const {
    return StoredFolder(store_, container_, paths_, paths_.toRelative(prefix));
}

std::vector<ListEntry> BlobFileSystem::collectEntries(const std::string& prefix) const {
    // Materialized before mutating: paging through a listing while its
    // objects are deleted or added is not well defined
    std::vector<ListEntry> entries;
    store_->listEntries(container_, prefix, [&entries](const ListEntry& entry) {
        entries.push_back(entry);
        return true;
    });
    return entries;
}

void BlobFileSystem::writeMarker(const std::string& path) {
    std::string marker_key = paths_.folderPrefix(path) + kFolderMarker;
    store_->openWrite(container_, marker_key, true)->close();

    if (verbose_logging_) {
        std::cout << "Created folder " << (path.empty() ? "/" : path) << std::endl;
    }
}

void BlobFileSystem::moveObject(const std::string& source_key, const std::string& destination_key) {
    store_->copyObject(container_, source_key, destination_key);

    try {
        store_->deleteObject(container_, source_key);
    } catch (const FileSystemError& e) {
        std::cerr << "[WARN] " << source_key << " was copied to " << destination_key
                  << " but could not be deleted; both objects now exist: " << e.what() << std::endl;
        throw;
    }

    if (verbose_logging_) {
        std::cout << "Renamed " << source_key << " to " << destination_key << std::endl;
    }
}

void BlobFileSystem::movePrefix(const std::string& source_prefix, const std::string& destination_prefix) {
    for (const auto& entry : collectEntries(source_prefix)) {
        if (const auto* object = std::get_if<ObjectMetadata>(&entry)) {
            moveObject(object->name, destination_prefix + object->name.substr(source_prefix.size()));
        } else {
            const std::string& child = std::get<PrefixEntry>(entry).prefix;
            movePrefix(child, destination_prefix + child.substr(source_prefix.size()));
        }
    }
}

void BlobFileSystem::deletePrefix(const std::string& prefix) {
    for (const auto& entry : collectEntries(prefix)) {
        if (const auto* object = std::get_if<ObjectMetadata>(&entry)) {
            store_->deleteObject(container_, object->name);
        } else {
            deletePrefix(std::get<PrefixEntry>(entry).prefix);
        }
    }
}

} // namespace blobfs
