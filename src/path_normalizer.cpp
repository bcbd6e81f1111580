#include "path_normalizer.hpp"
#include "errors.hpp"
#include <cctype>

namespace blobfs {

namespace {
    // Matches a leading "scheme://" token (RFC 3986 scheme characters)
    bool hasUrlScheme(const std::string& path) {
        size_t sep = path.find("://");
        if (sep == std::string::npos || sep == 0) {
            return false;
        }
        if (!std::isalpha(static_cast<unsigned char>(path[0]))) {
            return false;
        }
        for (size_t i = 1; i < sep; ++i) {
            unsigned char c = static_cast<unsigned char>(path[i]);
            if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
                return false;
            }
        }
        return true;
    }

    bool startsWith(const std::string& value, const std::string& prefix) {
        return value.size() >= prefix.size() &&
               value.compare(0, prefix.size(), prefix) == 0;
    }
}

PathNormalizer::PathNormalizer(const std::string& root, const std::string& base_address)
    : root_(trimSlashes(root)),
      base_address_(base_address)
{
    while (!base_address_.empty() && base_address_.back() == '/') {
        base_address_.pop_back();
    }
}

void PathNormalizer::ensureRelative(const std::string& path) {
    if (!path.empty() && path[0] == '/') {
        throw InvalidPathError("Path must be relative: " + path);
    }
    if (hasUrlScheme(path)) {
        throw InvalidPathError("Path must be relative, not a URL: " + path);
    }
}

std::string PathNormalizer::toKey(const std::string& path) const {
    ensureRelative(path);

    std::string relative = path;
    while (!relative.empty() && relative.back() == '/') {
        relative.pop_back();
    }

    if (root_.empty()) {
        return relative;
    }
    if (relative.empty()) {
        return root_;
    }
    return root_ + "/" + relative;
}

std::string PathNormalizer::folderPrefix(const std::string& path) const {
    std::string key = toKey(path);
    if (key.empty()) {
        return key;
    }
    return key + "/";
}

std::string PathNormalizer::toRelative(const std::string& key) const {
    std::string trimmed = key;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }

    if (root_.empty()) {
        return trimmed;
    }
    if (trimmed == root_) {
        return "";
    }
    if (!startsWith(trimmed, root_ + "/")) {
        throw InvalidPathError("Key " + key + " is outside root " + root_);
    }
    return trimmed.substr(root_.size() + 1);
}

std::string PathNormalizer::absoluteRoot() const {
    std::string absolute = base_address_ + "/";
    if (!root_.empty()) {
        absolute += root_ + "/";
    }
    return absolute;
}

std::string PathNormalizer::toPublicUrl(const std::string& path) const {
    return base_address_ + "/" + toKey(path);
}

std::string PathNormalizer::fromPublicUrl(const std::string& url) const {
    std::string absolute = absoluteRoot();
    if (!startsWith(url, absolute)) {
        throw InvalidPathError("URL " + url + " is not under " + absolute);
    }
    return trimSlashes(url.substr(absolute.size()));
}

std::string PathNormalizer::join(const std::string& parent, const std::string& child) {
    if (parent.empty()) {
        return child;
    }
    if (child.empty()) {
        return parent;
    }
    if (parent.back() == '/') {
        return parent + child;
    }
    return parent + "/" + child;
}

std::string PathNormalizer::nameOf(const std::string& path) {
    std::string trimmed = trimSlashes(path);
    size_t slash = trimmed.rfind('/');
    if (slash == std::string::npos) {
        return trimmed;
    }
    return trimmed.substr(slash + 1);
}

std::string PathNormalizer::parentOf(const std::string& path) {
    std::string trimmed = trimSlashes(path);
    size_t slash = trimmed.rfind('/');
    if (slash == std::string::npos) {
        return "";
    }
    return trimmed.substr(0, slash);
}

std::string PathNormalizer::extensionOf(const std::string& path) {
    std::string name = nameOf(path);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) {
        return "";
    }
    return name.substr(dot);
}

std::string PathNormalizer::trimSlashes(const std::string& path) {
    size_t begin = path.find_first_not_of('/');
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = path.find_last_not_of('/');
    return path.substr(begin, end - begin + 1);
}

} // namespace blobfs
