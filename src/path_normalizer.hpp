#pragma once

#include <string>

namespace blobfs {

/**
 * PathNormalizer - Maps virtual relative paths onto store keys
 *
 * A virtual path such as "docs/a.txt" lives under the configured root
 * prefix: with root "media" its key is "media/docs/a.txt", with an empty
 * root the key is the path itself. Separators are always '/'.
 *
 * Paths handed in by callers must be relative: a leading '/' or a URL
 * scheme ("http://", "gs://", ...) is rejected with InvalidPathError.
 * No method performs I/O.
 */
class PathNormalizer {
public:
    // base_address is the store URL of the container, without trailing '/'
    explicit PathNormalizer(const std::string& root, const std::string& base_address = "");

    const std::string& root() const { return root_; }
    const std::string& baseAddress() const { return base_address_; }

    // Throws InvalidPathError for absolute or scheme-qualified paths
    static void ensureRelative(const std::string& path);

    // Store key for a relative path (trailing '/' trimmed)
    std::string toKey(const std::string& path) const;

    // Key prefix listing the folder's direct children: key + "/", or ""
    // for the root of an unrooted container
    std::string folderPrefix(const std::string& path) const;

    // Inverse of toKey; throws InvalidPathError for keys outside the root
    std::string toRelative(const std::string& key) const;

    // <base_address>/<root>/
    std::string absoluteRoot() const;

    std::string toPublicUrl(const std::string& path) const;

    // Relative path of an absolute object URL under absoluteRoot()
    std::string fromPublicUrl(const std::string& url) const;

    static std::string join(const std::string& parent, const std::string& child);
    static std::string nameOf(const std::string& path);
    static std::string parentOf(const std::string& path);

    // Extension including the dot, empty when there is none
    static std::string extensionOf(const std::string& path);

    static std::string trimSlashes(const std::string& path);

private:
    std::string root_;
    std::string base_address_;
};

} // namespace blobfs
