#include "flattener.hpp"
#include "job_queue.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <system_error>

namespace docsync::engine {

    namespace {

        bool is_single_component(const std::string& s) {
            return !s.empty() && s != "." && s != ".." &&
                   s.find('/') == std::string::npos && s.find('\\') == std::string::npos &&
                   s.find('\0') == std::string::npos;
        }

        // Paths that differ only in case alias each other on case-insensitive filesystems.
        std::string collision_key(const std::filesystem::path& path) {
            std::string key = path.string();
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return key;
        }

        struct WriteJob {
            const Document* doc = nullptr;
            std::filesystem::path path;
        };

        bool write_atomically(const std::filesystem::path& target, const std::string& content, std::string& error) {
            std::error_code ec;
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec) {
                error = "cannot create directory: " + ec.message();
                return false;
            }

            auto tmp = target.parent_path() / (".docsync-tmp-" + target.filename().string());
            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                if (!out) {
                    error = "cannot open for writing: " + tmp.string();
                    return false;
                }
                out.write(content.data(), static_cast<std::streamsize>(content.size()));
                out.flush();
                if (!out) {
                    error = "write failed: " + tmp.string();
                    out.close();
                    std::filesystem::remove(tmp, ec);
                    return false;
                }
            }

            std::filesystem::rename(tmp, target, ec);
            if (ec) {
                error = "cannot replace file: " + ec.message();
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                return false;
            }
            return true;
        }

    }

    Flattener::Flattener(VersionStore& store, FlattenOptions options) : m_store(store), m_options(options) {}

    std::optional<std::filesystem::path> Flattener::target_path(const std::filesystem::path& root, const Document& doc,
                                                                const std::string& extension) {
        if (!is_single_component(doc.name)) return std::nullopt;

        std::filesystem::path dir = root;
        if (doc.category != kUncategorized) {
            if (!is_single_component(doc.category)) return std::nullopt;
            dir /= doc.category;
        }
        return (dir / (doc.name + extension)).lexically_normal();
    }

    FlattenSummary Flattener::flatten(const FlattenTargets& targets) {
        FlattenSummary summary;
        const std::vector<Document> docs = m_store.list_current();

        std::vector<WriteJob> jobs;
        std::map<std::string, std::vector<WriteJob>> owners;
        std::set<std::string> rejected; // ids

        for (const auto& doc : docs) {
            std::vector<std::filesystem::path> roots;
            if (doc.kind() == DocumentKind::Plan) {
                roots.push_back(targets.plan_root);
            } else {
                roots = targets.command_roots;
            }

            for (const auto& root : roots) {
                auto path = target_path(root, doc, targets.extension);
                if (!path) {
                    summary.errors.push_back({doc.name, root, "name or category is not a safe path component"});
                    rejected.insert(doc.id);
                    break;
                }
                auto& owned_by = owners[collision_key(*path)];
                bool repeated = std::any_of(owned_by.begin(), owned_by.end(),
                                            [&doc](const WriteJob& j) { return j.doc == &doc; });
                if (repeated) continue; // two spellings of one root
                jobs.push_back({&doc, *path});
                owned_by.push_back(jobs.back());
            }
        }

        for (const auto& [key, owned_by] : owners) {
            if (owned_by.size() < 2) continue;
            for (const auto& job : owned_by) {
                std::string others;
                for (const auto& other : owned_by) {
                    if (other.doc == job.doc) continue;
                    if (!others.empty()) others += ", ";
                    others += "'" + other.doc->name + "'";
                }
                summary.errors.push_back({job.doc->name, job.path, "path collides with " + others});
                rejected.insert(job.doc->id);
            }
        }

        jobs.erase(std::remove_if(jobs.begin(), jobs.end(),
                                  [&rejected](const WriteJob& j) { return rejected.count(j.doc->id) > 0; }),
                   jobs.end());

        std::mutex mutex;
        std::set<std::string> failed; // ids
        run_parallel<WriteJob>(jobs, m_options.workers, [&](WriteJob& job) {
            std::string error;
            bool ok = write_atomically(job.path, job.doc->content(), error);

            std::lock_guard<std::mutex> lock(mutex);
            if (ok) {
                summary.paths.push_back(job.path);
            } else {
                summary.errors.push_back({job.doc->name, job.path, error});
                failed.insert(job.doc->id);
            }
        });

        std::set<std::string> written;
        for (const auto& job : jobs) {
            if (!failed.count(job.doc->id)) written.insert(job.doc->name);
        }
        summary.written.assign(written.begin(), written.end());
        std::sort(summary.paths.begin(), summary.paths.end());
        std::sort(summary.errors.begin(), summary.errors.end(),
                  [](const FlattenError& a, const FlattenError& b) { return a.name < b.name || (a.name == b.name && a.path < b.path); });

        if (!m_options.quiet) {
            std::cout << "[Flatten] Wrote " << summary.paths.size() << " files for " << summary.written.size()
                      << " documents, " << summary.errors.size() << " errors\n";
        }
        for (const auto& e : summary.errors) {
            std::cerr << "[Flatten] " << e.name << ": " << e.reason << "\n";
        }
        return summary;
    }

}
