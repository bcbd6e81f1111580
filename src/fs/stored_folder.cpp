#include "stored_folder.hpp"
#include "../errors.hpp"
#include <variant>

namespace blobfs {

StoredFolder::StoredFolder(std::shared_ptr<const IBlobStore> store,
                           std::string container,
                           PathNormalizer paths,
                           std::string path)
    : store_(std::move(store)),
      container_(std::move(container)),
      paths_(std::move(paths)),
      path_(PathNormalizer::trimSlashes(path)) {}

std::string StoredFolder::name() const {
    return PathNormalizer::nameOf(path_);
}

std::int64_t StoredFolder::size() const {
    return aggregateSize(*store_, container_, paths_.folderPrefix(path_));
}

StoredFolder StoredFolder::parent() const {
    if (isRoot()) {
        throw NotFoundError("Folder " + paths_.absoluteRoot() + " does not have a parent folder");
    }
    return StoredFolder(store_, container_, paths_, PathNormalizer::parentOf(path_));
}

std::int64_t StoredFolder::aggregateSize(const IBlobStore& store,
                                         const std::string& container,
                                         const std::string& prefix) {
    std::int64_t size = 0;

    store.listEntries(container, prefix, [&](const ListEntry& entry) {
        if (const auto* object = std::get_if<ObjectMetadata>(&entry)) {
            size += object->size;
        } else {
            size += aggregateSize(store, container, std::get<PrefixEntry>(entry).prefix);
        }
        return true;
    });

    return size;
}

} // namespace blobfs
