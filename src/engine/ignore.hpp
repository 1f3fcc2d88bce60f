#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace docsync::engine {

    inline constexpr const char* kIgnoreFileName = ".docsync_ignore";

    class Ignore {
    public:
        /**
         * @brief Defaults plus the patterns of <root>/.docsync_ignore, if present.
         */
        static Ignore for_root(const std::filesystem::path& root);

        /**
         * @brief Loads glob patterns, one per line; '#' starts a comment.
         */
        void load(const std::filesystem::path& ignore_file);

        void add(const std::string& glob);

        /**
         * @brief Adds VCS metadata, editor swap files, OS litter and our own temp files.
         */
        void add_defaults();

        /**
         * @brief true if the file or directory name matches a pattern.
         */
        bool check(const std::filesystem::path& path) const;

    private:
        struct Pattern {
            std::regex regex;
            std::string original;
        };
        std::vector<Pattern> m_patterns;

        static std::string glob_to_regex(const std::string& glob);
    };

}
