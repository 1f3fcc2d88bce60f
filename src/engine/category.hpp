#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "docsync/types.hpp"

namespace docsync::engine {

    /**
     * @brief Closed, validated set of category labels built once from configuration.
     */
    class CategorySet {
    public:
        CategorySet() = default;

        /**
         * @brief Validates and builds the set. Labels are trimmed; empty,
         * duplicate, reserved ("uncategorized") or multi-component labels throw ConfigError.
         */
        static CategorySet from_labels(const std::vector<std::string>& labels);

        /**
         * @brief Parses a comma separated list ("go,python,tools").
         */
        static CategorySet from_list(const std::string& comma_list);

        /**
         * @brief The fixed plan lifecycle directories: drafts, approved, completed.
         */
        static CategorySet plan_lifecycle();

        bool contains(const std::string& label) const;
        const std::vector<std::string>& labels() const { return m_labels; }

    private:
        std::vector<std::string> m_labels;
    };

    /**
     * @brief Lifecycle status of a plan placed in the given category, if any.
     */
    std::optional<PlanStatus> plan_status(const std::string& category);
    const char* to_string(PlanStatus status);

    class CategoryResolver {
    public:
        explicit CategoryResolver(CategorySet categories);

        /**
         * @brief Creates every missing root and category subdirectory.
         * @return The directories that did not exist before.
         * @throws ConfigError if a directory cannot be created.
         */
        std::vector<std::filesystem::path> ensure_directories(const std::vector<std::filesystem::path>& roots,
                                                              bool quiet = false) const;

        /**
         * @brief Maps the file's parent directory name to a category label.
         * Files directly under the root, or under an unknown directory, are uncategorized.
         */
        std::string resolve(const std::filesystem::path& root, const std::filesystem::path& file) const;

        const CategorySet& categories() const { return m_categories; }

    private:
        CategorySet m_categories;
    };

}
