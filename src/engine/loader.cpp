#include "loader.hpp"
#include "ignore.hpp"
#include "job_queue.hpp"
#include "payload.hpp"
#include "util.hpp"
#include "docsync/sha256.h"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <system_error>

namespace docsync::engine {

    namespace {

        struct Candidate {
            std::filesystem::path path;
            DocumentKind kind;
            std::string category;

            // Filled by the reader.
            bool ok = false;
            std::string content;
            std::string error;
            std::filesystem::file_time_type mtime;
        };

        void read_candidate(Candidate& c) {
            std::ifstream file(c.path, std::ios::binary);
            if (!file.is_open()) {
                c.error = "cannot open file: " + std::error_code(errno, std::generic_category()).message();
                return;
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            if (file.bad()) {
                c.error = "read failed";
                return;
            }
            c.content = buffer.str();
            if (!is_valid_utf8(c.content)) {
                c.content.clear();
                c.error = "file is not valid UTF-8";
                return;
            }

            std::error_code ec;
            c.mtime = std::filesystem::last_write_time(c.path, ec);
            c.ok = true;
        }

        std::string join_categories(const std::vector<const Candidate*>& group) {
            std::vector<std::string> labels;
            for (const auto* c : group) {
                if (std::find(labels.begin(), labels.end(), c->category) == labels.end()) {
                    labels.push_back(c->category);
                }
            }
            std::string out;
            for (const auto& l : labels) {
                if (!out.empty()) out += ", ";
                out += l;
            }
            return out;
        }

    }

    DocumentLoader::DocumentLoader(LoaderOptions options) : m_options(std::move(options)) {}

    std::string DocumentLoader::derive_name(const std::filesystem::path& file) {
        return file.stem().string();
    }

    LoadResult DocumentLoader::load(const std::vector<DocumentSource>& sources) const {
        LoadResult result;
        std::vector<Candidate> candidates;
        size_t root_count = 0;

        for (const auto& source : sources) {
            for (const auto& root : source.roots) {
                ++root_count;
                std::error_code ec;
                if (!std::filesystem::is_directory(root, ec)) {
                    result.errors.push_back({root, "root is not a directory"});
                    continue;
                }

                Ignore ignore = Ignore::for_root(root);
                auto it = std::filesystem::recursive_directory_iterator(
                    root, std::filesystem::directory_options::skip_permission_denied, ec);
                if (ec) {
                    result.errors.push_back({root, "cannot scan root: " + ec.message()});
                    continue;
                }

                for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
                    if (ec) {
                        result.errors.push_back({root, "scan stopped: " + ec.message()});
                        break;
                    }

                    const auto& path = it->path();
                    if (ignore.check(path)) {
                        if (it->is_directory(ec)) {
                            it.disable_recursion_pending();
                        }
                        continue;
                    }

                    if (!it->is_regular_file(ec) || path.extension() != m_options.extension) continue;

                    Candidate c;
                    c.path = path;
                    c.kind = source.kind;
                    c.category = source.resolver.resolve(root, path);
                    candidates.push_back(std::move(c));
                }
            }
        }

        std::vector<size_t> jobs(candidates.size());
        for (size_t i = 0; i < jobs.size(); ++i) jobs[i] = i;
        run_parallel<size_t>(std::move(jobs), m_options.workers, [&candidates](size_t& i) {
            read_candidate(candidates[i]);
        });

        std::map<std::string, std::vector<const Candidate*>> by_name;
        for (const auto& c : candidates) {
            if (!c.ok) {
                result.errors.push_back({c.path, c.error});
            }
            by_name[derive_name(c.path)].push_back(&c);
        }

        for (const auto& [name, group] : by_name) {
            std::string ambiguity;
            if (group.size() > 1) {
                bool has_plan = false;
                bool has_command = false;
                for (const auto* c : group) {
                    (c->kind == DocumentKind::Plan ? has_plan : has_command) = true;
                }
                std::string categories = join_categories(group);

                if (has_plan && has_command) {
                    ambiguity = "name '" + name + "' is used by both a command and a plan";
                } else if (has_plan) {
                    ambiguity = "plan '" + name + "' appears in more than one lifecycle directory (" + categories + ")";
                } else if (categories.find(',') != std::string::npos) {
                    ambiguity = "command '" + name + "' appears under more than one category (" + categories + ")";
                }
            }

            if (!ambiguity.empty()) {
                for (const auto* c : group) {
                    if (c->ok) result.errors.push_back({c->path, ambiguity});
                }
                continue;
            }

            // Same command in the same category of parallel roots: newest file wins,
            // equal times go to the smaller path.
            const Candidate* chosen = nullptr;
            for (const auto* c : group) {
                if (!c->ok) continue;
                if (!chosen || c->mtime > chosen->mtime || (c->mtime == chosen->mtime && c->path < chosen->path)) {
                    chosen = c;
                }
            }
            if (!chosen) continue;

            Document doc;
            doc.name = name;
            doc.category = chosen->category;
            doc.data = make_data(chosen->kind, chosen->content);
            doc.content_hash = crypto::content_hash(chosen->content);
            doc.source_path = chosen->path;
            result.documents.push_back(std::move(doc));
        }

        std::sort(result.errors.begin(), result.errors.end(),
                  [](const LoadError& a, const LoadError& b) { return a.path < b.path; });

        if (!m_options.quiet) {
            std::cout << "[Loader] Scanned " << candidates.size() << " files in " << root_count
                      << " roots: " << result.documents.size() << " documents, "
                      << result.errors.size() << " errors\n";
        }
        return result;
    }

}
