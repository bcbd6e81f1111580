#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "fs/blob_file_system.hpp"

namespace blobfs {

// Bad command line: unknown option, missing command. Exit code 2.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * BlobFSConfig - Configuration options for the blobfs tool
 *
 * Supports layered configuration from multiple sources:
 * 1. Defaults (lowest priority)
 * 2. YAML config file
 * 3. Environment variables
 * 4. Command-line arguments (highest priority)
 */
struct BlobFSConfig {
    // Store connection, see ConnectionString
    std::string connection_string;

    // Container (bucket) name (required)
    std::string container_name;

    // Key prefix every path lives under, "" for the whole container
    std::string root;

    // Grant anonymous read access to the container
    bool public_access = false;

    // Run against an empty in-process store instead of the remote one
    bool use_memory_store = false;

    // Logging settings
    bool debug_mode = false;
    bool verbose_logging = false;

    bool help_requested = false;

    // Sub-command and its arguments
    std::string command;
    std::vector<std::string> command_args;

    /**
     * Load configuration from all sources in priority order
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed configuration
     * @throws UsageError for malformed command lines
     * @throws std::runtime_error if required settings are missing or invalid
     */
    static BlobFSConfig load(int argc, char* argv[]);

    /**
     * Apply command-line overrides to an existing config
     *
     * @throws UsageError on unknown options or missing option values
     */
    void parseFromArgs(int argc, char* argv[]);

    /**
     * Load configuration from YAML file
     *
     * @param config_path Path to YAML config file
     * @return true if file was loaded successfully, false if file doesn't exist
     * @throws std::runtime_error if file exists but is invalid
     */
    bool loadFromYAML(const std::string& config_path);

    /**
     * Load configuration from environment variables
     * Recognizes: BLOBFS_* variables
     */
    void loadFromEnv();

    void loadDefaults();

    /**
     * Validate configuration
     * @throws std::runtime_error if configuration is invalid
     */
    void validate() const;

    FileSystemOptions toFileSystemOptions() const;

    static void printUsage(const char* program_name);

private:
    /**
     * Extract --config flag from arguments before full parsing
     */
    static std::optional<std::string> extractConfigPath(int argc, char* argv[]);
};

} // namespace blobfs
