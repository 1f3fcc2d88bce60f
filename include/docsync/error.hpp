#pragma once
#include <stdexcept>
#include <string>

namespace docsync {

    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Invalid configuration or an unusable root directory. Fatal.
     */
    class ConfigError : public Error {
    public:
        using Error::Error;
    };

    /**
     * @brief A store operation failed for one document. Recoverable at the
     * batch level: the document is reported and the batch continues.
     */
    class StoreError : public Error {
    public:
        using Error::Error;
    };

    /**
     * @brief The persisted baseline is corrupt (hash mismatch, malformed
     * payload, history gap). Aborts the whole run.
     */
    class ConsistencyError : public Error {
    public:
        using Error::Error;
    };

}
