#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "../fs/blob_file_system.hpp"

namespace blobfs {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

/**
 * Throws UsageError if command is unknown or gets the wrong number of
 * arguments. Lets main() reject a bad command line before it connects.
 */
void checkCommandLine(const std::string& command, const std::vector<std::string>& args);

/**
 * Run one sub-command against the file system
 *
 * Results go to out, diagnostics to err.
 * @return kExitOk, kExitError for a failed operation, kExitUsage for a
 *         bad command line
 */
int runCommand(BlobFileSystem& fs,
               const std::string& command,
               const std::vector<std::string>& args,
               std::ostream& out,
               std::ostream& err);

} // namespace blobfs
