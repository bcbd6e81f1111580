#include "cli.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <stdexcept>

namespace blobfs {

namespace {
    using Handler = std::function<void(BlobFileSystem&, const std::vector<std::string>&, std::ostream&)>;

    struct Command {
        size_t min_args;
        size_t max_args;
        const char* usage;
        Handler handler;
    };

    std::string formatTime(std::chrono::system_clock::time_point time) {
        std::time_t seconds = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
        return buffer;
    }

    // Optional folder argument, the root when omitted
    std::string folderArg(const std::vector<std::string>& args) {
        return args.empty() ? std::string() : args[0];
    }

    void catFile(BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream& out) {
        auto reader = fs.getFile(args[0]).openRead();
        std::copy(std::istreambuf_iterator<char>(*reader), std::istreambuf_iterator<char>(),
                  std::ostreambuf_iterator<char>(out));
        if (reader->bad()) {
            throw StoreError("Failed reading " + args[0]);
        }
    }

    void putFile(BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream& out) {
        const std::string& local_path = args[0];
        const std::string& path = args[1];

        std::ifstream input(local_path, std::ios::binary);
        if (!input) {
            throw std::runtime_error("Cannot open local file " + local_path);
        }

        StoredFile file = fs.fileExists(path) ? fs.getFile(path) : fs.createFile(path);
        auto writer = file.openWrite();
        std::copy(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>(),
                  std::ostreambuf_iterator<char>(*writer));
        if (input.bad() || !*writer) {
            throw StoreError("Failed uploading " + local_path + " to " + path);
        }
        writer->close();

        out << path << " (" << fs.getFile(path).size() << " bytes)\n";
    }

    void statFile(BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream& out) {
        StoredFile file = fs.getFile(args[0]);
        out << "path:    " << file.path() << "\n"
            << "key:     " << file.key() << "\n"
            << "size:    " << file.size() << "\n"
            << "updated: " << formatTime(file.lastUpdated()) << "\n"
            << "type:    " << file.fileType() << "\n";
    }

    void listFiles(BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream& out) {
        fs.forEachFile(folderArg(args), [&out](const StoredFile& file) {
            out << file.size() << "\t" << formatTime(file.lastUpdated()) << "\t" << file.path() << "\n";
            return true;
        });
    }

    void listFolders(BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream& out) {
        for (const auto& folder : fs.listFolders(folderArg(args))) {
            out << folder.path() << "/\n";
        }
    }

    const std::map<std::string, Command>& commands() {
        static const std::map<std::string, Command> table = {
            {"exists", {1, 1, "exists <path>",
                [](BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream& out) {
                    out << (fs.fileExists(args[0]) ? "true" : "false") << "\n";
                }}},
            {"stat", {1, 1, "stat <path>", statFile}},
            {"cat", {1, 1, "cat <path>", catFile}},
            {"put", {2, 2, "put <local> <path>", putFile}},
            {"touch", {1, 1, "touch <path>",
                [](BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream&) {
                    fs.createFile(args[0]);
                }}},
            {"rm", {1, 1, "rm <path>",
                [](BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream&) {
                    fs.deleteFile(args[0]);
                }}},
            {"mv", {2, 2, "mv <path> <new_path>",
                [](BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream&) {
                    fs.renameFile(args[0], args[1]);
                }}},
            {"ls", {0, 1, "ls [path]", listFiles}},
            {"dirs", {0, 1, "dirs [path]", listFolders}},
            {"mkdir", {1, 1, "mkdir <path>",
                [](BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream&) {
                    fs.createFolder(args[0]);
                }}},
            {"rmdir", {1, 1, "rmdir <path>",
                [](BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream&) {
                    fs.deleteFolder(args[0]);
                }}},
            {"mvdir", {2, 2, "mvdir <path> <new_path>",
                [](BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream&) {
                    fs.renameFolder(args[0], args[1]);
                }}},
            {"du", {0, 1, "du [path]",
                [](BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream& out) {
                    out << fs.getFolderSize(folderArg(args)) << "\n";
                }}},
            {"url", {1, 1, "url <path>",
                [](BlobFileSystem& fs, const std::vector<std::string>& args, std::ostream& out) {
                    out << fs.getPublicUrl(args[0]) << "\n";
                }}},
        };
        return table;
    }
}

void checkCommandLine(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands().find(command);
    if (it == commands().end()) {
        throw UsageError("Unknown command: " + command);
    }
    if (args.size() < it->second.min_args || args.size() > it->second.max_args) {
        throw UsageError(std::string("Usage: blobfs [options] ") + it->second.usage);
    }
}

int runCommand(BlobFileSystem& fs,
               const std::string& command,
               const std::vector<std::string>& args,
               std::ostream& out,
               std::ostream& err) {
    try {
        checkCommandLine(command, args);
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << std::endl;
        return kExitUsage;
    }

    try {
        commands().at(command).handler(fs, args, out);
        out.flush();
        return kExitOk;
    } catch (const FileSystemError& e) {
        err << "Error (" << errorCodeName(e.code()) << "): " << e.what() << std::endl;
    } catch (const std::runtime_error& e) {
        err << "Error: " << e.what() << std::endl;
    }
    return kExitError;
}

} // namespace blobfs
