#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "docsync/types.hpp"
#include "category.hpp"

namespace docsync::engine {

    /**
     * @brief A set of root trees holding documents of one kind, with the
     * category set that applies beneath them.
     */
    struct DocumentSource {
        DocumentKind kind;
        std::vector<std::filesystem::path> roots;
        CategoryResolver resolver;
    };

    struct LoaderOptions {
        std::string extension = ".md";
        size_t workers = 4;
        bool quiet = false;
    };

    class DocumentLoader {
    public:
        explicit DocumentLoader(LoaderOptions options = {});

        /**
         * @brief Scans every root of every source and reads matching files.
         *
         * Per-file failures (unreadable, invalid UTF-8, ambiguous name) are
         * returned as LoadErrors and never stop the scan. Documents come back
         * sorted by name.
         */
        LoadResult load(const std::vector<DocumentSource>& sources) const;

        /**
         * @brief Logical document name for a file: its stem.
         */
        static std::string derive_name(const std::filesystem::path& file);

    private:
        LoaderOptions m_options;
    };

}
