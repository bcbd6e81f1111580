// blobfs command-line entry point

#include "cli/cli.hpp"
#include "config.hpp"
#include "connection_string.hpp"
#include "errors.hpp"
#include "fs/blob_file_system.hpp"
#include "gcs/gcs_blob_store.hpp"
#include "store/memory_blob_store.hpp"
#include <iostream>
#include <memory>

using namespace blobfs;

namespace {
    std::shared_ptr<IBlobStore> makeStore(const BlobFSConfig& config) {
        if (config.use_memory_store) {
            if (config.verbose_logging) {
                std::cout << "Using in-memory store; nothing will be persisted" << std::endl;
            }
            return std::make_shared<MemoryBlobStore>();
        }

        ConnectionString connection = ConnectionString::parse(config.connection_string);
        if (config.verbose_logging) {
            std::cout << "Connecting to " << connection.describe() << std::endl;
        }
        return std::make_shared<GCSBlobStore>(connection, config.debug_mode);
    }
}

int main(int argc, char *argv[])
{
    try {
        BlobFSConfig config = BlobFSConfig::load(argc, argv);
        if (config.help_requested) {
            BlobFSConfig::printUsage(argv[0]);
            return kExitOk;
        }

        // Reject bad commands before touching the store
        checkCommandLine(config.command, config.command_args);

        BlobFileSystem fs(makeStore(config), config.toFileSystemOptions());
        return runCommand(fs, config.command, config.command_args, std::cout, std::cerr);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "\nUse --help for usage information.\n";
        return kExitUsage;
    } catch (const FileSystemError& e) {
        std::cerr << "Error (" << errorCodeName(e.code()) << "): " << e.what() << std::endl;
        return kExitError;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return kExitError;
    }
}
