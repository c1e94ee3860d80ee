#ifndef AIRLINK_TRANSFER_HISTORY_HPP
#define AIRLINK_TRANSFER_HISTORY_HPP

#include "Transfer.hpp"
#include "Types.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace airlink {

    /** Receives every transfer that reached a terminal state. Write-only from the coordinator. */
    class TransferHistory {
    public:
        virtual ~TransferHistory() = default;
        virtual bool append(const TransferRecord& record) = 0;

        // Drops every stored record
        virtual bool clear() = 0;
    };

    class MemoryTransferHistory : public TransferHistory {
    public:
        explicit MemoryTransferHistory(size_t maxEntries = MAX_HISTORY_ENTRIES);

        bool append(const TransferRecord& record) override;
        bool clear() override;

        std::vector<TransferRecord> entries() const;
        size_t size() const;

    private:
        size_t maxEntries;
        mutable std::mutex mtx;
        std::vector<TransferRecord> records;
    };

    /**
     * Appends one '|' separated line per record to a file inside the data directory.
     * When the file grows past twice the limit it is rewritten with the most recent
     * maxEntries lines.
     */
    class FileTransferHistory : public TransferHistory {
    public:
        explicit FileTransferHistory(const std::string& dataDirectory, size_t maxEntries = MAX_HISTORY_ENTRIES);

        // ==== BASIC OPERATIONS ====
        bool initialize();
        bool append(const TransferRecord& record) override;
        bool clear() override;

        // ==== QUERIES ====
        std::vector<TransferRecord> load() const;
        bool compact();

        const std::string& filePath() const { return historyFile; }

        static std::string encodeRecord(const TransferRecord& record);
        static bool decodeRecord(const std::string& line, TransferRecord& out);

    private:
        std::string dataDir;
        std::string historyFile;
        size_t maxEntries;
        size_t lineCount = 0;
        mutable std::mutex mtx;

        std::vector<std::string> readLines() const;
        bool compactLocked();
    };

} // namespace airlink

#endif // AIRLINK_TRANSFER_HISTORY_HPP
