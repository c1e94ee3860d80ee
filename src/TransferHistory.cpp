#include "airlink/TransferHistory.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <algorithm>

namespace fs = std::filesystem;

namespace airlink {

    namespace {

        constexpr char FIELD_SEPARATOR = '|';
        constexpr size_t FIELD_COUNT = 14;

        std::string cleanField(const std::string& value) {
            std::string out = value;
            std::replace(out.begin(), out.end(), FIELD_SEPARATOR, '/');
            std::replace(out.begin(), out.end(), '\n', ' ');
            std::replace(out.begin(), out.end(), '\r', ' ');
            return out;
        }

        int64_t toMillis(TimePoint tp) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        }

        TimePoint fromMillis(int64_t ms) {
            return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
        }

        std::vector<std::string> splitFields(const std::string& line) {
            std::vector<std::string> fields;
            std::string field;
            std::istringstream in(line);
            while (std::getline(in, field, FIELD_SEPARATOR)) {
                fields.push_back(field);
            }
            // getline drops a trailing empty field
            if (!line.empty() && line.back() == FIELD_SEPARATOR) {
                fields.emplace_back();
            }
            return fields;
        }

    } // namespace

    // ============================================================
    //  MEMORY
    // ============================================================

    MemoryTransferHistory::MemoryTransferHistory(size_t maxEntries)
        : maxEntries(maxEntries) {}

    bool MemoryTransferHistory::append(const TransferRecord& record) {
        std::lock_guard<std::mutex> lock(mtx);
        records.push_back(record);
        if (maxEntries > 0 && records.size() > maxEntries) {
            records.erase(records.begin(), records.begin() + static_cast<std::ptrdiff_t>(records.size() - maxEntries));
        }
        return true;
    }

    bool MemoryTransferHistory::clear() {
        std::lock_guard<std::mutex> lock(mtx);
        records.clear();
        return true;
    }

    std::vector<TransferRecord> MemoryTransferHistory::entries() const {
        std::lock_guard<std::mutex> lock(mtx);
        return records;
    }

    size_t MemoryTransferHistory::size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return records.size();
    }

    // ============================================================
    //  FILE
    // ============================================================

    FileTransferHistory::FileTransferHistory(const std::string& dataDirectory, size_t maxEntries)
        : dataDir(dataDirectory),
          historyFile((fs::path(dataDirectory) / "transfer_history.log").string()),
          maxEntries(maxEntries) {}

    bool FileTransferHistory::initialize() {
        std::lock_guard<std::mutex> lock(mtx);
        try {
            fs::create_directories(dataDir);
            if (!fs::exists(historyFile)) {
                std::ofstream file(historyFile);
                if (!file.is_open()) {
                    std::cerr << "Error: Cannot create history file: " << historyFile << std::endl;
                    return false;
                }
            }
            lineCount = readLines().size();
        } catch (const std::exception& e) {
            std::cerr << "Error initializing transfer history: " << e.what() << std::endl;
            return false;
        }

        if (lineCount > maxEntries) {
            return compactLocked();
        }
        return true;
    }

    bool FileTransferHistory::append(const TransferRecord& record) {
        std::lock_guard<std::mutex> lock(mtx);

        std::ofstream file(historyFile, std::ios::app);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open history file: " << historyFile << std::endl;
            return false;
        }

        file << encodeRecord(record) << '\n';
        if (!file.good()) {
            std::cerr << "Error: Failed to write history record " << record.id << std::endl;
            return false;
        }
        file.close();
        ++lineCount;

        if (maxEntries > 0 && lineCount >= 2 * maxEntries) {
            if (!compactLocked()) {
                std::cerr << "Warning: Failed to compact transfer history" << std::endl;
            }
        }
        return true;
    }

    bool FileTransferHistory::clear() {
        std::lock_guard<std::mutex> lock(mtx);

        std::ofstream file(historyFile, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot truncate history file: " << historyFile << std::endl;
            return false;
        }
        lineCount = 0;
        return true;
    }

    std::vector<TransferRecord> FileTransferHistory::load() const {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<TransferRecord> out;
        for (const auto& line : readLines()) {
            TransferRecord record;
            if (decodeRecord(line, record)) {
                out.push_back(std::move(record));
            } else {
                std::cerr << "Warning: Skipping malformed history line" << std::endl;
            }
        }
        return out;
    }

    bool FileTransferHistory::compact() {
        std::lock_guard<std::mutex> lock(mtx);
        return compactLocked();
    }

    std::vector<std::string> FileTransferHistory::readLines() const {
        std::vector<std::string> lines;
        std::ifstream file(historyFile);
        if (!file.is_open()) {
            return lines;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty()) {
                lines.push_back(line);
            }
        }
        return lines;
    }

    bool FileTransferHistory::compactLocked() {
        try {
            auto lines = readLines();
            if (lines.size() > maxEntries) {
                lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(lines.size() - maxEntries));
            }

            const std::string tmpFile = historyFile + ".tmp";
            {
                std::ofstream file(tmpFile, std::ios::trunc);
                if (!file.is_open()) {
                    std::cerr << "Error: Cannot create " << tmpFile << std::endl;
                    return false;
                }
                for (const auto& line : lines) {
                    file << line << '\n';
                }
                if (!file.good()) {
                    std::cerr << "Error: Failed to write " << tmpFile << std::endl;
                    return false;
                }
            }

            fs::rename(tmpFile, historyFile);
            lineCount = lines.size();
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Error compacting transfer history: " << e.what() << std::endl;
            return false;
        }
    }

    std::string FileTransferHistory::encodeRecord(const TransferRecord& record) {
        std::ostringstream out;
        out << cleanField(record.id) << FIELD_SEPARATOR
            << transferDirectionToString(record.direction) << FIELD_SEPARATOR
            << cleanField(record.fromPeerId) << FIELD_SEPARATOR
            << cleanField(record.toPeerId) << FIELD_SEPARATOR
            << cleanField(record.peerId) << FIELD_SEPARATOR
            << cleanField(record.resource.name) << FIELD_SEPARATOR
            << record.resource.totalSizeBytes << FIELD_SEPARATOR
            << cleanField(record.resource.contentKind) << FIELD_SEPARATOR
            << record.bytesTransferred << FIELD_SEPARATOR
            << transferStateToString(record.state) << FIELD_SEPARATOR
            << errorKindToString(record.errorKind) << FIELD_SEPARATOR
            << toMillis(record.startedAt) << FIELD_SEPARATOR
            << toMillis(record.endedAt) << FIELD_SEPARATOR
            << cleanField(record.lastError);
        return out.str();
    }

    bool FileTransferHistory::decodeRecord(const std::string& line, TransferRecord& out) {
        const auto fields = splitFields(line);
        if (fields.size() != FIELD_COUNT || fields[0].empty()) {
            return false;
        }

        try {
            TransferRecord record;
            record.id = fields[0];
            record.direction = transferDirectionFromString(fields[1]);
            record.fromPeerId = fields[2];
            record.toPeerId = fields[3];
            record.peerId = fields[4];
            record.resource.name = fields[5];
            record.resource.totalSizeBytes = std::stoull(fields[6]);
            record.resource.contentKind = fields[7];
            record.bytesTransferred = std::stoull(fields[8]);
            record.state = transferStateFromString(fields[9]);
            record.errorKind = errorKindFromString(fields[10]);
            record.startedAt = fromMillis(std::stoll(fields[11]));
            record.endedAt = fromMillis(std::stoll(fields[12]));
            record.lastError = fields[13];
            out = std::move(record);
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

} // namespace airlink
