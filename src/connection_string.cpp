#include "connection_string.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace blobfs {

namespace {
    std::string trim(const std::string& value) {
        size_t begin = value.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return "";
        }
        size_t end = value.find_last_not_of(" \t\r\n");
        return value.substr(begin, end - begin + 1);
    }

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    bool parseBool(const std::string& key, const std::string& value) {
        std::string lowered = toLower(value);
        if (lowered == "true" || lowered == "1" || lowered == "yes") {
            return true;
        }
        if (lowered == "false" || lowered == "0" || lowered == "no") {
            return false;
        }
        throw std::runtime_error("Connection string: invalid boolean for " + key + ": " + value);
    }
}

ConnectionString ConnectionString::parse(const std::string& value) {
    if (trim(value).empty()) {
        throw std::runtime_error("Connection string is empty");
    }

    ConnectionString result;
    std::stringstream stream(value);
    std::string pair;

    while (std::getline(stream, pair, ';')) {
        pair = trim(pair);
        if (pair.empty()) {
            continue;  // tolerate trailing ';'
        }

        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::runtime_error("Connection string: expected Key=Value, got '" + pair + "'");
        }

        std::string key = toLower(trim(pair.substr(0, eq)));
        std::string val = trim(pair.substr(eq + 1));

        if (key == "endpoint") {
            while (!val.empty() && val.back() == '/') {
                val.pop_back();
            }
            result.endpoint_ = val;
        } else if (key == "projectid") {
            result.project_id_ = val;
        } else if (key == "credentialsfile") {
            result.credentials_file_ = val;
        } else if (key == "anonymous") {
            result.anonymous_ = parseBool("Anonymous", val);
        } else {
            throw std::runtime_error("Connection string: unknown key '" + trim(pair.substr(0, eq)) + "'");
        }
    }

    if (result.anonymous_ && !result.credentials_file_.empty()) {
        throw std::runtime_error("Connection string: CredentialsFile cannot be combined with Anonymous=true");
    }

    return result;
}

std::string ConnectionString::describe() const {
    std::ostringstream out;
    out << "endpoint=" << (endpoint_.empty() ? "(default)" : endpoint_);
    if (!project_id_.empty()) {
        out << " project=" << project_id_;
    }
    if (anonymous_) {
        out << " credentials=anonymous";
    } else if (!credentials_file_.empty()) {
        out << " credentials=service-account";
    } else {
        out << " credentials=default";
    }
    return out.str();
}

} // namespace blobfs
