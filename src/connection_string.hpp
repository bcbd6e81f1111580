#pragma once

#include <string>

namespace blobfs {

/**
 * ConnectionString - Store endpoint and credentials in one value
 *
 * Format: semicolon separated Key=Value pairs, keys case-insensitive.
 *
 *   Endpoint=https://storage.googleapis.com;ProjectId=my-project;
 *   CredentialsFile=/etc/blobfs/sa.json
 *
 * Recognized keys:
 *   Endpoint         Store base URL (default https://storage.googleapis.com)
 *   ProjectId        Project that owns newly created containers
 *   CredentialsFile  Service account JSON key file
 *   Anonymous        true to send unauthenticated requests (emulators)
 *
 * Without CredentialsFile or Anonymous the SDK's application default
 * credentials are used.
 */
class ConnectionString {
public:
    /**
     * Parse a connection string
     *
     * @throws std::runtime_error on empty input, a pair without '=',
     *         an unknown key, a bad boolean, or CredentialsFile combined
     *         with Anonymous=true
     */
    static ConnectionString parse(const std::string& value);

    const std::string& endpoint() const { return endpoint_; }
    const std::string& projectId() const { return project_id_; }
    const std::string& credentialsFile() const { return credentials_file_; }
    bool anonymous() const { return anonymous_; }

    // Printable form with the credentials path elided
    std::string describe() const;

private:
    std::string endpoint_;
    std::string project_id_;
    std::string credentials_file_;
    bool anonymous_ = false;
};

} // namespace blobfs
