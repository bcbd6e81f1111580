#include "stored_file.hpp"
#include "../errors.hpp"
#include "../path_normalizer.hpp"
#include <iterator>

namespace blobfs {

StoredFile::StoredFile(std::shared_ptr<const IBlobStore> store,
                       std::string container,
                       std::string path,
                       ObjectMetadata metadata)
    : store_(std::move(store)),
      container_(std::move(container)),
      path_(std::move(path)),
      metadata_(std::move(metadata)) {}

std::string StoredFile::name() const {
    return PathNormalizer::nameOf(path_);
}

std::string StoredFile::fileType() const {
    return PathNormalizer::extensionOf(path_);
}

std::unique_ptr<std::istream> StoredFile::openRead() const {
    return store_->openRead(container_, metadata_.name);
}

std::unique_ptr<BlobWriteStream> StoredFile::openWrite() const {
    return store_->openWrite(container_, metadata_.name);
}

std::string StoredFile::readAll() const {
    auto reader = openRead();
    std::string content{std::istreambuf_iterator<char>{*reader}, {}};
    if (reader->bad()) {
        throw StoreError("Failed reading " + path_);
    }
    return content;
}

void StoredFile::writeAll(const std::string& content) const {
    auto writer = openWrite();
    writer->write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!*writer) {
        throw StoreError("Failed writing " + path_);
    }
    writer->close();
}

} // namespace blobfs
