#include "checksums.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "fetcher.hpp"
#include "localization.hpp"
#include "package_index.hpp"
#include "resolver.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {
    const std::vector<std::string> COMMANDS = {"install", "list", "uninstall", "update", "version"};

    void print_usage(const cxxopts::Options& options) {
        std::cerr << options.help({"", "compatibility"});
        std::cerr << get_string("info.commands") << std::endl;
        std::cerr << get_string("info.install_desc") << std::endl;
        std::cerr << get_string("info.uninstall_desc") << std::endl;
        std::cerr << get_string("info.update_desc") << std::endl;
        std::cerr << get_string("info.list_desc") << std::endl;
        std::cerr << get_string("info.version_desc") << std::endl;
    }

    std::string select_command(const cxxopts::ParseResult& result, const cxxopts::Options& options) {
        std::string command;
        for (const auto& candidate : COMMANDS) {
            if (!result[candidate].as<bool>()) continue;
            if (!command.empty()) {
                print_usage(options);
                throw SdkmException(get_string("error.multiple_commands"));
            }
            command = candidate;
        }
        return command.empty() ? "install" : command;
    }

    std::vector<std::string> requested_packages(const cxxopts::ParseResult& result) {
        std::vector<std::string> packages;
        if (result.count("package_file")) {
            for (const auto& file : result["package_file"].as<std::vector<std::string>>()) {
                const auto lines = read_lines_from_file(file);
                packages.insert(packages.end(), lines.begin(), lines.end());
            }
        }
        if (result.count("packages")) {
            const auto& positional = result["packages"].as<std::vector<std::string>>();
            packages.insert(packages.end(), positional.begin(), positional.end());
        }
        return packages;
    }

    void print_package_list(const std::vector<std::string>& names) {
        size_t width = std::string("Path").size();
        for (const auto& name : names) {
            width = std::max(width, name.size());
        }

        std::cout << get_string("info.installed_packages") << std::endl;
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << "Path" << " | Version       | Description | Location" << std::endl;
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << "-------" << " | -------       | -------     | -------" << std::endl;
        std::cout << std::endl;
        std::cout << get_string("info.available_packages") << std::endl;
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << "Path" << " | Version       | Description" << std::endl;
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << "-------" << " | -------       | -------" << std::endl;
        for (const auto& name : names) {
            std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << name << " |               | " << std::endl;
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0], string_format("info.usage", std::string(argv[0])));

        options.add_options()
            ("h,help", get_string("help.help"))
            ("install", get_string("help.install"), cxxopts::value<bool>()->default_value("false"))
            ("list", get_string("help.list"), cxxopts::value<bool>()->default_value("false"))
            ("uninstall", get_string("help.uninstall"), cxxopts::value<bool>()->default_value("false"))
            ("update", get_string("help.update"), cxxopts::value<bool>()->default_value("false"))
            ("version", get_string("help.version"), cxxopts::value<bool>()->default_value("false"))
            ("sdk_root", get_string("help.sdk_root"), cxxopts::value<std::string>())
            ("package_file", get_string("help.package_file"), cxxopts::value<std::vector<std::string>>())
            ("verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("packages", "", cxxopts::value<std::vector<std::string>>());

        // Accepted for command-line compatibility; they have no effect
        options.add_options("compatibility")
            ("channel", get_string("help.ignored"), cxxopts::value<std::string>())
            ("include_obsolete", get_string("help.ignored"), cxxopts::value<bool>()->default_value("false"))
            ("no_https", get_string("help.ignored"), cxxopts::value<bool>()->default_value("false"))
            ("proxy", get_string("help.ignored"), cxxopts::value<std::string>())
            ("proxy_host", get_string("help.ignored"), cxxopts::value<std::string>())
            ("proxy_port", get_string("help.ignored"), cxxopts::value<std::string>());

        options.parse_positional({"packages"});
        options.positional_help(get_string("help.packages"));

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        set_verbose_mode(result["verbose"].as<bool>());
        const std::string command = select_command(result, options);

        if (command == "version") {
            std::cout << SDKM_VERSION << std::endl;
            return 0;
        }

        if (result.count("sdk_root")) {
            set_sdk_root(result["sdk_root"].as<std::string>());
        }
        init_cache_dir();

        CurlGlobal curl_global;
        const bool use_net = command == "list" || command == "update";
        const PackageIndex index = build_package_index(fetch_manifest(use_net));

        if (command == "update") {
            log_info(string_format("info.manifest_updated", index.size()));
            return 0;
        }
        if (command == "list") {
            Resolver resolver(index, SDK_ROOT);
            print_package_list(resolver.list());
            return 0;
        }

        const std::vector<std::string> packages = requested_packages(result);
        if (packages.empty()) {
            print_usage(options);
            throw SdkmException(get_string("error.no_packages"));
        }

        init_sdk_root();
        Resolver resolver(index, SDK_ROOT);

        if (command == "install") {
            CachingFetcher fetcher(CACHE_DIR);
            const BatchResult batch = resolver.install_packages(packages, fetcher);
            if (!batch.ok()) {
                log_error(string_format("error.install_failures", batch.failed.size(), packages.size()));
                return 1;
            }
            log_info(get_string("info.install_complete"));
        } else if (command == "uninstall") {
            for (const auto& package : packages) {
                resolver.uninstall(parse_identifier(package));
            }
            log_info(get_string("info.uninstall_complete"));
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", std::string(e.what())));
        return 1;
    } catch (const SdkmException& e) {
        log_error(string_format("error.sdkm_error", std::string(e.what())));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", std::string(e.what())));
        return 1;
    }

    return 0;
}
