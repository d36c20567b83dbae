/**
 * @file download_example.cpp
 * @brief Download an object or directory tree from Latch Data
 *
 * This example demonstrates:
 * - Wiring the downloader to the HTTP signed URL issuer and curl streams
 * - Choosing an overwrite policy and progress mode
 * - Answering interactive overwrite prompts on stdin
 * - Reporting errors returned by the engine
 *
 * Node metadata lookup is outside this library. The example classifies
 * a source by its shape: a path ending in '/' is treated as a directory,
 * anything else as a single object. Pass --dir to force directory mode.
 */

#include <latch/ldata/ldata.h>

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

using namespace latch::ldata;

namespace {

/**
 * @brief node_resolver that infers the node type from the path itself
 */
class path_shape_resolver : public node_resolver {
public:
    explicit path_shape_resolver(bool force_directory) : force_directory_(force_directory) {}

    auto resolve(const std::vector<std::string>& paths)
        -> result<std::map<std::string, node_data>> override {
        std::map<std::string, node_data> nodes;
        for (const auto& path : paths) {
            auto normalized = normalize_remote_path(path);
            node_data node;
            node.name = remote_basename(normalized);
            node.type = (force_directory_ || normalized.back() == '/') ? node_type::dir
                                                                     : node_type::obj;
            nodes.emplace(path, std::move(node));
        }
        return nodes;
    }

private:
    bool force_directory_;
};

auto ask_on_stdin(const std::filesystem::path& blocking) -> bool {
    std::cout << blocking.string()
              << " is a file and blocks a directory in the download. Replace it? [y/N] "
              << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Download Example - ldata_transfer " << version::to_string() << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <remote_path> <local_path>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --dir                   Treat the source as a directory" << std::endl;
    std::cout << "  -f, --force             Replace files that block directories" << std::endl;
    std::cout << "  -s, --skip              Never replace blocking files" << std::endl;
    std::cout << "  -q, --quiet             No progress output" << std::endl;
    std::cout << "  --total-only            Only show the aggregate progress bar" << std::endl;
    std::cout << "  -v, --verbose           Print a line per completed file" << std::endl;
    std::cout << "  -j, --jobs <n>          Maximum parallel downloads" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Environment:" << std::endl;
    std::cout << "  LATCH_API_URL, FLYTE_INTERNAL_EXECUTION_ID, LDATA_MAX_WORKERS, "
                 "LDATA_CHUNK_SIZE" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " latch:///welcome/sample.fastq ./sample.fastq" << std::endl;
    std::cout << "  " << program << " -f -j 8 latch:///runs/2024/ ./runs" << std::endl;
}

int main(int argc, char* argv[]) {
    download_options options;
    auto config = transfer_config::from_environment();
    bool force_directory = false;
    std::string source;
    std::string destination;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--dir") {
            force_directory = true;
        } else if (arg == "-f" || arg == "--force") {
            options.policy = overwrite_policy::force_overwrite;
        } else if (arg == "-s" || arg == "--skip") {
            options.policy = overwrite_policy::always_skip;
        } else if (arg == "-q" || arg == "--quiet") {
            options.progress = progress_mode::none;
        } else if (arg == "--total-only") {
            options.progress = progress_mode::total;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            std::string_view value(argv[i]);
            std::size_t workers = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), workers);
            if (value.empty() || ec != std::errc{} || end != value.data() + value.size()) {
                std::cerr << "Error: --jobs expects a worker count, got '" << value << "'"
                          << std::endl;
                return 1;
            }
            config.max_workers = workers;
        } else if (arg[0] != '-') {
            if (source.empty()) {
                source = arg;
            } else if (destination.empty()) {
                destination = arg;
            }
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return 1;
        }
    }

    if (source.empty() || destination.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (!curl_object_opener::is_available()) {
        std::cerr << "Error: built without libcurl, objects cannot be streamed" << std::endl;
        return 1;
    }

    auto auth = resolve_auth_header(credential_sources::from_environment());
    if (!auth) {
        std::cerr << "Error: " << auth.error().message << std::endl;
        return 1;
    }

    auto issuer = std::make_shared<http_signed_url_issuer>(
        make_api_http_client(config.http_timeout),
        api_endpoints::from_environment(),
        auth.value());

    auto built = downloader::builder()
        .with_node_resolver(std::make_shared<path_shape_resolver>(force_directory))
        .with_signed_url_issuer(issuer)
        .with_object_opener(std::make_shared<curl_object_opener>(config.connect_timeout))
        .with_config(config)
        .with_confirm_callback(ask_on_stdin)
        .build();

    if (!built) {
        std::cerr << "Error: " << built.error().message << std::endl;
        return 1;
    }

    auto report = built.value().download(source, destination, options);
    if (!report) {
        std::cerr << "Error [" << to_string(report.error().code) << "]: "
                  << report.error().message << std::endl;
        return 1;
    }

    if (!report.value().skipped.empty()) {
        std::cout << report.value().skipped.size()
                  << " path(s) were left in place" << std::endl;
    }
    return 0;
}
