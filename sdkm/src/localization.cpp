#include "localization.hpp"
#include "config.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::once_flag default_load_flag;

    bool load_strings(const std::string& lang) {
        std::ifstream file(L10N_DIR / (lang + ".txt"));
        if (!file.is_open()) {
            if (lang != "en") {
                // utils.hpp logging needs the table we are loading, so warn directly
                std::cerr << "Could not open localization file for " << lang << ", falling back to English." << std::endl;
                return load_strings("en");
            }
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = line.substr(0, pos);
                std::string value = line.substr(pos + 1);
                translations[key] = value;
            }
        }
        return true;
    }
}

void init_localization() {
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::islower(static_cast<unsigned char>(lang_env[0])) &&
        std::islower(static_cast<unsigned char>(lang_env[1]))) {
        lang = std::string(lang_env, 2);
    }
    load_strings(lang);
}

const std::string& get_string(const std::string& key) {
    // Library callers (and the tests) may log before main() ran init_localization()
    if (translations.empty()) {
        std::call_once(default_load_flag, [] { load_strings("en"); });
    }

    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
