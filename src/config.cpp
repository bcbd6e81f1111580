#include "config.hpp"
#include <getopt.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>

namespace blobfs {

namespace {
    bool parseBool(const std::string& name, std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "true" || value == "1" || value == "yes" || value == "on") {
            return true;
        }
        if (value == "false" || value == "0" || value == "no" || value == "off") {
            return false;
        }
        throw std::runtime_error("Invalid boolean value for " + name + ": " + value);
    }

    void readEnv(const char* name, std::string& target) {
        if (const char* value = std::getenv(name)) {
            target = value;
        }
    }

    void readEnv(const char* name, bool& target) {
        if (const char* value = std::getenv(name)) {
            target = parseBool(name, value);
        }
    }

    template <typename T>
    void readYAML(const YAML::Node& node, const char* key, T& target) {
        if (node[key]) {
            target = node[key].as<T>();
        }
    }
}

BlobFSConfig BlobFSConfig::load(int argc, char* argv[]) {
    BlobFSConfig config;
    config.loadDefaults();

    auto config_path = extractConfigPath(argc, argv);
    if (config_path && !config.loadFromYAML(*config_path)) {
        throw std::runtime_error("Config file not found: " + *config_path);
    }

    config.loadFromEnv();
    config.parseFromArgs(argc, argv);

    if (!config.help_requested) {
        config.validate();
    }
    return config;
}

void BlobFSConfig::loadDefaults() {
    connection_string.clear();
    container_name.clear();
    root.clear();
    public_access = false;
    use_memory_store = false;
    debug_mode = false;
    verbose_logging = false;
    help_requested = false;
    command.clear();
    command_args.clear();
}

bool BlobFSConfig::loadFromYAML(const std::string& config_path) {
    if (!std::ifstream(config_path).good()) {
        return false;
    }

    try {
        YAML::Node node = YAML::LoadFile(config_path);
        if (node.IsNull()) {
            return true;  // empty or comments only
        }
        if (!node.IsMap()) {
            throw std::runtime_error("Config file " + config_path + " must contain key: value pairs");
        }

        // Unknown keys are ignored
        readYAML(node, "connection_string", connection_string);
        readYAML(node, "container_name", container_name);
        readYAML(node, "root", root);
        readYAML(node, "public_access", public_access);
        readYAML(node, "use_memory_store", use_memory_store);
        readYAML(node, "debug", debug_mode);
        readYAML(node, "verbose", verbose_logging);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config file " + config_path + ": " + e.what());
    }

    if (debug_mode) {
        std::cout << "[DEBUG] Loaded config file " << config_path << std::endl;
    }
    return true;
}

void BlobFSConfig::loadFromEnv() {
    readEnv("BLOBFS_CONNECTION_STRING", connection_string);
    readEnv("BLOBFS_CONTAINER", container_name);
    readEnv("BLOBFS_ROOT", root);
    readEnv("BLOBFS_PUBLIC", public_access);
    readEnv("BLOBFS_MEMORY_STORE", use_memory_store);
    readEnv("BLOBFS_DEBUG", debug_mode);
    readEnv("BLOBFS_VERBOSE", verbose_logging);
}

void BlobFSConfig::parseFromArgs(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"config",            required_argument, 0, 'c'},
        {"connection-string", required_argument, 0, 'S'},
        {"container",         required_argument, 0, 'n'},
        {"root",              required_argument, 0, 'r'},
        {"public",            no_argument,       0, 'p'},
        {"memory-store",      no_argument,       0, 'm'},
        {"debug",             no_argument,       0, 'd'},
        {"verbose",           no_argument,       0, 'v'},
        {"help",              no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // 0 rather than 1 also resets glibc's internal scanning state.
    // '+' stops at the command so its arguments may start with '-'
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "+:c:n:r:dvh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                // Already applied by load()
                break;
            case 'S':
                connection_string = optarg;
                break;
            case 'n':
                container_name = optarg;
                break;
            case 'r':
                root = optarg;
                break;
            case 'p':
                public_access = true;
                break;
            case 'm':
                use_memory_store = true;
                break;
            case 'd':
                debug_mode = true;
                break;
            case 'v':
                verbose_logging = true;
                break;
            case 'h':
                help_requested = true;
                break;
            case ':':
                throw UsageError(std::string("Missing value for option ") + argv[optind - 1]);
            case '?':
            default:
                throw UsageError(std::string("Unknown option: ") + argv[optind - 1]);
        }
    }

    if (optind < argc) {
        command = argv[optind++];
        command_args.clear();
        while (optind < argc) {
            command_args.push_back(argv[optind++]);
        }
    }
}

void BlobFSConfig::validate() const {
    if (container_name.empty()) {
        throw std::runtime_error("Missing required setting: container_name (--container or BLOBFS_CONTAINER)");
    }
    if (connection_string.empty() && !use_memory_store) {
        throw std::runtime_error(
            "Missing required setting: connection_string (--connection-string or BLOBFS_CONNECTION_STRING)");
    }
    if (command.empty()) {
        throw UsageError("Missing command");
    }
}

FileSystemOptions BlobFSConfig::toFileSystemOptions() const {
    FileSystemOptions options;
    options.container_name = container_name;
    options.root = root;
    options.access = public_access ? ContainerAccess::PublicRead : ContainerAccess::Private;
    options.debug_mode = debug_mode;
    options.verbose_logging = verbose_logging;
    return options;
}

std::optional<std::string> BlobFSConfig::extractConfigPath(int argc, char* argv[]) {
    // Options that take their value as the next argument
    static const char* const kValueOptions[] = {
        "--connection-string", "--container", "-n", "--root", "-r"
    };

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--") == 0 || argv[i][0] != '-') {
            break;  // command reached
        }
        if ((std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
        if (std::strncmp(argv[i], "--config=", 9) == 0) {
            return std::string(argv[i] + 9);
        }
        for (const char* option : kValueOptions) {
            if (std::strcmp(argv[i], option) == 0) {
                i++;
                break;
            }
        }
    }
    return std::nullopt;
}

void BlobFSConfig::printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  exists <path>            Print whether a file exists\n";
    std::cout << "  stat <path>              Show size, modification time and type of a file\n";
    std::cout << "  cat <path>               Write a file's content to stdout\n";
    std::cout << "  put <local> <path>       Upload a local file, replacing any existing one\n";
    std::cout << "  touch <path>             Create an empty file\n";
    std::cout << "  rm <path>                Delete a file\n";
    std::cout << "  mv <path> <new_path>     Rename a file\n";
    std::cout << "  ls [path]                List files in a folder\n";
    std::cout << "  dirs [path]              List sub-folders (creates the folder if missing)\n";
    std::cout << "  mkdir <path>             Create a folder\n";
    std::cout << "  rmdir <path>             Delete a folder and everything below it\n";
    std::cout << "  mvdir <path> <new_path>  Rename a folder and everything below it\n";
    std::cout << "  du [path]                Print the total size of a folder in bytes\n";
    std::cout << "  url <path>               Print the public URL of a file\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE            YAML config file\n";
    std::cout << "  --connection-string VALUE    Endpoint=...;ProjectId=...;CredentialsFile=...;Anonymous=...\n";
    std::cout << "  -n, --container NAME         Container (bucket) name\n";
    std::cout << "  -r, --root PREFIX            Key prefix all paths live under\n";
    std::cout << "  --public                     Make the container publicly readable\n";
    std::cout << "  --memory-store               Use an empty in-memory store (dry run)\n";
    std::cout << "  -d, --debug                  Enable debug logging\n";
    std::cout << "  -v, --verbose                Enable verbose output\n";
    std::cout << "  -h, --help                   Display this help message\n\n";

    std::cout << "Environment:\n";
    std::cout << "  BLOBFS_CONNECTION_STRING, BLOBFS_CONTAINER, BLOBFS_ROOT, BLOBFS_PUBLIC,\n";
    std::cout << "  BLOBFS_MEMORY_STORE, BLOBFS_DEBUG, BLOBFS_VERBOSE\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --container media ls docs\n";
    std::cout << "  " << program_name << " --container media --root site mvdir docs archive/docs\n";
    std::cout << "  " << program_name << " --memory-store --container scratch --debug dirs\n";
}

} // namespace blobfs
