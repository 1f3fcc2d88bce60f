#include "sync_engine.hpp"
#include "docsync/error.hpp"
#include <iostream>

namespace docsync::engine {

    SyncEngine::SyncEngine(VersionStore& store, DocumentLoader loader, SyncOptions options)
        : m_store(store), m_loader(std::move(loader)), m_options(std::move(options)) {}

    SyncSummary SyncEngine::sync(const std::vector<DocumentSource>& sources, const std::atomic<bool>* cancel) {
        SyncSummary summary;

        for (const auto& source : sources) {
            source.resolver.ensure_directories(source.roots, m_options.quiet);
        }

        if (m_options.verify_before_sync) {
            m_store.verify_integrity();
        }

        if (m_options.project_ref) {
            try {
                if (m_store.ensure_project(*m_options.project_ref, *m_options.project_ref) && !m_options.quiet) {
                    std::cout << "[Sync] Registered project: " << *m_options.project_ref << "\n";
                }
            } catch (const StoreError& e) {
                std::cerr << "[Sync] Cannot register project " << *m_options.project_ref << ": " << e.what() << "\n";
                summary.errors.push_back({*m_options.project_ref, e.what(), SyncError::Stage::Store});
            }
        }

        LoadResult loaded = m_loader.load(sources);
        for (const auto& e : loaded.errors) {
            summary.errors.push_back({e.path.string(), e.reason, SyncError::Stage::Load});
        }

        for (auto& doc : loaded.documents) {
            if (cancel && cancel->load()) {
                summary.interrupted = true;
                std::cerr << "[Sync] Interrupted before '" << doc.name << "'\n";
                break;
            }

            if (doc.kind() == DocumentKind::Plan && !doc.project_ref && m_options.project_ref) {
                doc.project_ref = m_options.project_ref;
            }

            try {
                UpsertResult result = m_store.upsert(doc);
                switch (result.outcome) {
                    case UpsertOutcome::Created:
                        summary.created.push_back(doc.name);
                        break;
                    case UpsertOutcome::Updated:
                        summary.updated.push_back(doc.name);
                        break;
                    case UpsertOutcome::Unchanged:
                        summary.unchanged.push_back(doc.name);
                        break;
                }
            } catch (const StoreError& e) {
                std::cerr << "[Sync] " << doc.name << ": " << e.what() << "\n";
                summary.errors.push_back({doc.name, e.what(), SyncError::Stage::Store});
            }
        }

        if (!m_options.quiet) {
            std::cout << "[Sync] " << summary.created.size() << " created, " << summary.updated.size() << " updated, "
                      << summary.unchanged.size() << " unchanged, " << summary.errors.size() << " errors"
                      << (summary.interrupted ? " (interrupted)" : "") << "\n";
        }
        return summary;
    }

    FlattenSummary SyncEngine::flatten(const FlattenTargets& targets, const FlattenOptions& options) {
        Flattener flattener(m_store, options);
        return flattener.flatten(targets);
    }

}
