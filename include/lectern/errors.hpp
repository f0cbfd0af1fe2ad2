#pragma once
#include <stdexcept>
#include <string>

namespace lectern::engine {

    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& message) : std::runtime_error(message) {}
    };

    /**
     * @brief File unreadable, or undecodable by every encoding in the fallback chain.
     */
    class ExtractionError : public Error {
    public:
        using Error::Error;
    };

    class SegmentationError : public Error {
    public:
        using Error::Error;
    };

    /**
     * @brief A chunk cannot meet its token budget, or the token counter failed.
     */
    class ChunkingError : public Error {
    public:
        using Error::Error;
    };

    class EmbeddingError : public Error {
    public:
        using Error::Error;
    };

    /**
     * @brief Persistence failure. connection_lost() marks failures that must abort a whole run.
     */
    class StorageError : public Error {
    public:
        explicit StorageError(const std::string& message, bool connection_lost = false)
            : Error(message), m_connection_lost(connection_lost) {}

        bool connection_lost() const { return m_connection_lost; }

    private:
        bool m_connection_lost;
    };

    class ConfigError : public Error {
    public:
        using Error::Error;
    };

}
