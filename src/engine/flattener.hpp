#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "docsync/types.hpp"
#include "version_store.hpp"

namespace docsync::engine {

    /**
     * @brief Where each kind of document is projected on disk.
     */
    struct FlattenTargets {
        std::vector<std::filesystem::path> command_roots;
        std::filesystem::path plan_root;
        std::string extension = ".md";
    };

    struct FlattenOptions {
        size_t workers = 4;
        bool quiet = false;
    };

    class Flattener {
    public:
        Flattener(VersionStore& store, FlattenOptions options = {});

        /**
         * @brief Writes every current document to <root>/<category>/<name><ext>.
         *
         * Reads one snapshot of the current table and never touches history.
         * Unsafe names, path collisions between different documents, and write
         * failures become FlattenErrors; colliding documents are not written.
         */
        FlattenSummary flatten(const FlattenTargets& targets);

        /**
         * @brief Expected path of a document under a root, or nullopt if its
         * name or category could escape or alias a directory.
         */
        static std::optional<std::filesystem::path> target_path(const std::filesystem::path& root, const Document& doc,
                                                                const std::string& extension);

    private:
        VersionStore& m_store;
        FlattenOptions m_options;
    };

}
