#include "ignore.hpp"
#include <fstream>
#include <cstring>

namespace docsync::engine {

    Ignore Ignore::for_root(const std::filesystem::path& root) {
        Ignore ignore;
        ignore.add_defaults();
        ignore.load(root / kIgnoreFileName);
        return ignore;
    }

    void Ignore::load(const std::filesystem::path& ignore_file) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(ignore_file, ec)) return;

        std::ifstream file(ignore_file);
        std::string line;
        while (std::getline(file, line)) {
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;
            add(line);
        }
    }

    void Ignore::add(const std::string& glob) {
        m_patterns.push_back({std::regex(glob_to_regex(glob)), glob});
    }

    void Ignore::add_defaults() {
        static const char* defaults[] = {
            ".git", ".svn", ".hg",
            ".DS_Store", "Thumbs.db",
            "*.swp", "*.swo", "*~", ".#*",
            ".docsync-tmp-*", kIgnoreFileName
        };
        for (const char* p : defaults) {
            add(p);
        }
    }

    bool Ignore::check(const std::filesystem::path& path) const {
        std::string filename = path.filename().string();
        for (const auto& p : m_patterns) {
            if (std::regex_match(filename, p.regex)) return true;
        }
        return false;
    }

    std::string Ignore::glob_to_regex(const std::string& glob) {
        std::string regex_str = "^";
        for (char c : glob) {
            if (c == '*') {
                regex_str += ".*";
            } else if (c == '?') {
                regex_str += ".";
            } else if (c == '/') {
                regex_str += "[/\\\\]";
            } else if (std::strchr(".+()[]{}^$|\\", c) != nullptr) {
                regex_str += '\\';
                regex_str += c;
            } else {
                regex_str += c;
            }
        }
        regex_str += "$";
        return regex_str;
    }

}
