#include "category.hpp"
#include "docsync/error.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <system_error>

namespace docsync::engine {

    namespace {

        std::string trim(const std::string& s) {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        std::filesystem::path normalized(const std::filesystem::path& p) {
            auto n = p.lexically_normal();
            if (!n.has_filename() && n.has_parent_path()) n = n.parent_path();
            return n;
        }

    }

    CategorySet CategorySet::from_labels(const std::vector<std::string>& labels) {
        CategorySet set;
        for (const auto& raw : labels) {
            std::string label = trim(raw);
            if (label.empty()) {
                throw ConfigError("empty category label");
            }
            if (label == "." || label == ".." || label.find('/') != std::string::npos ||
                label.find('\\') != std::string::npos) {
                throw ConfigError("category label must be a single directory name: " + label);
            }
            if (label == kUncategorized) {
                throw ConfigError(std::string("category label is reserved: ") + kUncategorized);
            }
            if (set.contains(label)) {
                throw ConfigError("duplicate category label: " + label);
            }
            set.m_labels.push_back(label);
        }
        return set;
    }

    CategorySet CategorySet::from_list(const std::string& comma_list) {
        std::vector<std::string> labels;
        std::stringstream ss(comma_list);
        std::string item;
        while (std::getline(ss, item, ',')) {
            labels.push_back(item);
        }
        return from_labels(labels);
    }

    CategorySet CategorySet::plan_lifecycle() {
        return from_labels({"drafts", "approved", "completed"});
    }

    bool CategorySet::contains(const std::string& label) const {
        return std::find(m_labels.begin(), m_labels.end(), label) != m_labels.end();
    }

    std::optional<PlanStatus> plan_status(const std::string& category) {
        if (category == "drafts") return PlanStatus::Draft;
        if (category == "approved") return PlanStatus::Approved;
        if (category == "completed") return PlanStatus::Completed;
        return std::nullopt;
    }

    const char* to_string(PlanStatus status) {
        switch (status) {
            case PlanStatus::Draft: return "draft";
            case PlanStatus::Approved: return "approved";
            case PlanStatus::Completed: return "completed";
        }
        return "unknown";
    }

    CategoryResolver::CategoryResolver(CategorySet categories) : m_categories(std::move(categories)) {}

    std::vector<std::filesystem::path> CategoryResolver::ensure_directories(const std::vector<std::filesystem::path>& roots,
                                                                          bool quiet) const {
        std::vector<std::filesystem::path> created;

        auto ensure = [&created, quiet](const std::filesystem::path& dir) {
            std::error_code ec;
            bool made = std::filesystem::create_directories(dir, ec);
            if (ec) {
                throw ConfigError("cannot create directory " + dir.string() + ": " + ec.message());
            }
            if (!std::filesystem::is_directory(dir, ec)) {
                throw ConfigError("not a directory: " + dir.string());
            }
            if (made) {
                if (!quiet) std::cout << "[Categories] Created: " << dir.string() << "\n";
                created.push_back(dir);
            }
        };

        for (const auto& root : roots) {
            ensure(root);
            for (const auto& label : m_categories.labels()) {
                ensure(root / label);
            }
        }
        return created;
    }

    std::string CategoryResolver::resolve(const std::filesystem::path& root, const std::filesystem::path& file) const {
        auto parent = normalized(file.parent_path());
        if (parent == normalized(root)) return kUncategorized;

        std::string dir = parent.filename().string();
        if (m_categories.contains(dir)) return dir;
        return kUncategorized;
    }

}
