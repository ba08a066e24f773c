#include "signature.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace {
    // Runs argv[0] from PATH and returns its exit status, or -1 when it did
    // not exit normally.
    int run_command(const std::vector<std::string>& args) {
        std::vector<char*> c_args;
        for (const auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
        c_args.push_back(nullptr);

        pid_t pid = fork();
        if (pid == -1) {
            throw SdkmException(string_format("error.fork_failed", std::string(std::strerror(errno))));
        }
        if (pid == 0) {
            execvp(c_args[0], c_args.data());
            _exit(127);
        }
        int status;
        if (waitpid(pid, &status, 0) == -1) {
            throw SdkmException(string_format("error.fork_failed", std::string(std::strerror(errno))));
        }
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

    [[noreturn]] void reject(const fs::path& file, const fs::path& signature, const std::string& message) {
        std::error_code ec;
        fs::remove(file, ec);
        fs::remove(signature, ec);
        throw VerificationFailure(message);
    }
}

fs::path signature_path_for(const fs::path& file) {
    return fs::path(file.string() + ".asc");
}

void verify_signature(const fs::path& file, const fs::path& keyring) {
    if (!fs::is_regular_file(keyring)) {
        throw ConfigurationError(string_format("error.keyring_missing", keyring.string()));
    }
    const fs::path signature = signature_path_for(file);
    if (!fs::is_regular_file(signature)) {
        reject(file, signature, string_format("error.signature_missing", signature.string()));
    }

    log_debug(string_format("debug.verifying_signature", file.string(), keyring.string()));
    const int ret = run_command({"gpgv", "--keyring", keyring.string(), signature.string(), file.string()});
    if (ret == 127) {
        throw ConfigurationError(get_string("error.gpgv_not_found"));
    }
    if (ret != 0) {
        reject(file, signature, string_format("error.signature_invalid", file.string(), ret));
    }
    log_info(string_format("info.signature_ok", file.filename().string()));
}
