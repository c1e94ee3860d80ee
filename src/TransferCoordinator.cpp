#include "airlink/TransferCoordinator.hpp"
#include "airlink/Random.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <cassert>
#include <iostream>

namespace airlink {

    TransferCoordinator::TransferCoordinator(PeerRegistry& peerRegistry,
                                             PeerTransport& peerTransport,
                                             ResourceProvider& resourceProvider,
                                             TransferHistory& transferHistory,
                                             CoordinatorConfig config)
        : registry(peerRegistry),
          transport(peerTransport),
          resources(resourceProvider),
          history(transferHistory),
          cfg(config),
          transferPool(std::make_unique<boost::asio::thread_pool>(std::max<size_t>(1, config.maxConcurrentTransfers))),
          probePool(std::make_unique<boost::asio::thread_pool>(std::max<size_t>(1, config.probeThreads))) {}

    TransferCoordinator::~TransferCoordinator() {
        shutdown();
    }

    void TransferCoordinator::shutdown() {
        std::vector<std::string> live;
        std::vector<TransferRecord> dropped;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (stopping) {
                return;
            }
            stopping = true;

            for (auto& [id, entry] : transfers) {
                const TransferState state = entry.record.state;
                if (state == TransferState::PENDING) {
                    // Queued jobs will never run, close the record here
                    transitionLocked(entry, TransferState::FAILED);
                    entry.record.lastError = "Coordinator stopped before the transfer started";
                    entry.record.errorKind = ErrorKind::VALIDATION;
                    recordTerminalLocked(entry);
                    dropped.push_back(entry.record);
                } else if (state == TransferState::CONNECTING ||
                           state == TransferState::ACTIVE ||
                           state == TransferState::PAUSED) {
                    live.push_back(id);
                }
            }
        }

        for (const auto& record : dropped) {
            appendHistory(record);
            publish(record, TransferEventType::STATE_CHANGED);
        }

        for (const auto& id : live) {
            cancel(id);
        }

        transferPool->join();
        probePool->join();
    }

    // ============================================================
    //  CONTROL
    // ============================================================

    OpStatus TransferCoordinator::initiate(const ResourceDescriptor& resource,
                                           const std::string& fromPeerId,
                                           const std::string& toPeerId,
                                           TransferDirection direction,
                                           std::string& outId) {
        outId.clear();

        const std::string& counterpart = direction == TransferDirection::OUTBOUND ? toPeerId : fromPeerId;
        if (counterpart.empty() || !registry.contains(counterpart)) {
            std::cerr << "Warning: Cannot start transfer, unknown peer '" << counterpart << "'" << std::endl;
            return OpStatus::UNKNOWN_PEER;
        }

        ResourceDescriptor resolved = resource;
        if (direction == TransferDirection::INBOUND && resolved.totalSizeBytes == 0) {
            std::cerr << "Warning: Cannot pull '" << resolved.name << "' without a known size" << std::endl;
            return OpStatus::INVALID_RESOURCE;
        }

        std::string error;
        if (!resources.resolve(resolved, direction, error) || resolved.totalSizeBytes == 0) {
            std::cerr << "Warning: Invalid resource '" << resolved.name << "': " << error << std::endl;
            return OpStatus::INVALID_RESOURCE;
        }

        Entry entry;
        TransferRecord& record = entry.record;
        record.id = Random::transferId();
        record.direction = direction;
        record.fromPeerId = fromPeerId;
        record.toPeerId = toPeerId;
        record.peerId = counterpart;
        record.resource = resolved;
        record.state = TransferState::PENDING;
        record.chunkSize = chunkSizeFor(resolved.totalSizeBytes);
        record.startedAt = Clock::now();

        const TransferRecord created = record;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (stopping) {
                return OpStatus::NOT_APPLICABLE;
            }
            entry.sequence = nextSequence++;
            ++initiatedCount;
            transfers.emplace(created.id, std::move(entry));
        }

        std::cout << "Info: Transfer " << created.id << " created ("
                  << transferDirectionToString(direction) << ", " << created.resource.name << ", "
                  << created.resource.totalSizeBytes << " bytes, peer " << counterpart << ")" << std::endl;

        publish(created, TransferEventType::CREATED);
        schedule(created.id, 0);
        outId = created.id;
        return OpStatus::OK;
    }

    OpStatus TransferCoordinator::pause(const std::string& id) {
        TransferRecord snapshot;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = transfers.find(id);
            if (it == transfers.end()) {
                return OpStatus::NOT_FOUND;
            }
            if (it->second.record.state == TransferState::PAUSED) {
                return OpStatus::OK;
            }
            if (!transitionLocked(it->second, TransferState::PAUSED)) {
                return OpStatus::NOT_APPLICABLE;
            }
            snapshot = it->second.record;
        }

        publish(snapshot, TransferEventType::STATE_CHANGED);
        return OpStatus::OK;
    }

    OpStatus TransferCoordinator::resume(const std::string& id) {
        TransferRecord resumed;
        TransferRecord failed;
        uint64_t generation = 0;
        bool restart = false;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = transfers.find(id);
            if (it == transfers.end()) {
                return OpStatus::NOT_FOUND;
            }

            Entry& entry = it->second;
            if (entry.record.state == TransferState::ACTIVE) {
                return OpStatus::OK;
            }
            if (!transitionLocked(entry, TransferState::ACTIVE)) {
                return OpStatus::NOT_APPLICABLE;
            }
            resumed = entry.record;

            if (entry.parked) {
                entry.parked = false;
                if (entry.heldError.empty()) {
                    // A parked loop has no worker, hand it a new one
                    restart = true;
                    generation = entry.generation;
                } else {
                    transitionLocked(entry, TransferState::FAILED);
                    entry.record.lastError = std::move(entry.heldError);
                    entry.record.errorKind = ErrorKind::IO;
                    entry.heldError.clear();
                    entry.rate = 0.0;
                    recordTerminalLocked(entry);
                    failed = entry.record;
                }
            }
        }

        publish(resumed, TransferEventType::STATE_CHANGED);

        if (failed.state == TransferState::FAILED) {
            std::cerr << "Error: Transfer " << id << " failed (io): " << failed.lastError << std::endl;
            appendHistory(failed);
            publish(failed, TransferEventType::STATE_CHANGED);
        } else if (restart) {
            boost::asio::post(*transferPool, [this, id, generation]() {
                continueTransfer(id, generation);
            });
        }
        return OpStatus::OK;
    }

    OpStatus TransferCoordinator::cancel(const std::string& id) {
        TransferRecord snapshot;
        std::shared_ptr<TransferChannel> inFlight;
        std::shared_ptr<Session> parked;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = transfers.find(id);
            if (it == transfers.end()) {
                return OpStatus::NOT_FOUND;
            }

            Entry& entry = it->second;
            if (entry.record.state == TransferState::CANCELLED) {
                return OpStatus::OK;
            }

            if (!transitionLocked(entry, TransferState::CANCELLED)) {
                return OpStatus::NOT_APPLICABLE;
            }

            // Between chunks the loop wakes up and says goodbye itself
            if (entry.parked) {
                parked = std::move(entry.session);
                entry.session.reset();
                entry.parked = false;
            } else if (entry.chunkInFlight && entry.session) {
                inFlight = entry.session->channel;
            }
            entry.heldBytes = 0;
            entry.heldError.clear();
            recordTerminalLocked(entry);
            snapshot = entry.record;
        }

        if (inFlight) {
            inFlight->abort();
        }
        if (parked) {
            boost::asio::post(*transferPool, [parked]() {
                sayGoodbye(*parked);
            });
        }

        std::cout << "Info: Transfer " << id << " cancelled at "
                  << snapshot.bytesTransferred << "/" << snapshot.resource.totalSizeBytes << " bytes" << std::endl;

        appendHistory(snapshot);
        publish(snapshot, TransferEventType::STATE_CHANGED);
        return OpStatus::OK;
    }

    OpStatus TransferCoordinator::retry(const std::string& id) {
        TransferRecord snapshot;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = transfers.find(id);
            if (it == transfers.end()) {
                return OpStatus::NOT_FOUND;
            }

            Entry& entry = it->second;
            if (entry.record.state == TransferState::PENDING) {
                return OpStatus::OK;
            }
            if (stopping || !transitionLocked(entry, TransferState::PENDING)) {
                return OpStatus::NOT_APPLICABLE;
            }

            ++entry.generation;
            entry.session.reset();
            entry.rate = 0.0;
            entry.chunkInFlight = false;
            entry.parked = false;
            entry.heldBytes = 0;
            entry.heldError.clear();
            entry.record.bytesTransferred = 0;
            entry.record.startedAt = Clock::now();
            entry.record.endedAt = TimePoint{};
            entry.record.lastError.clear();
            entry.record.errorKind = ErrorKind::NONE;

            generation = entry.generation;
            snapshot = entry.record;
        }

        std::cout << "Info: Retrying transfer " << id << std::endl;
        publish(snapshot, TransferEventType::STATE_CHANGED);
        schedule(id, generation);
        return OpStatus::OK;
    }

    OpStatus TransferCoordinator::remove(const std::string& id) {
        bool live = false;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = transfers.find(id);
            if (it == transfers.end()) {
                return OpStatus::NOT_FOUND;
            }
            const TransferState state = it->second.record.state;
            live = state == TransferState::CONNECTING ||
                   state == TransferState::ACTIVE ||
                   state == TransferState::PAUSED;
        }

        if (live) {
            cancel(id);
        }

        TransferRecord snapshot;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = transfers.find(id);
            if (it == transfers.end()) {
                return OpStatus::NOT_FOUND;
            }
            snapshot = it->second.record;
            transfers.erase(it);
        }

        publish(snapshot, TransferEventType::REMOVED);
        return OpStatus::OK;
    }

    size_t TransferCoordinator::clearFinished() {
        std::vector<TransferRecord> removed;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = transfers.begin();
            while (it != transfers.end()) {
                if (it->second.record.isTerminal()) {
                    removed.push_back(it->second.record);
                    it = transfers.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (const auto& record : removed) {
            publish(record, TransferEventType::REMOVED);
        }
        return removed.size();
    }

    // ============================================================
    //  QUERIES
    // ============================================================

    OpStatus TransferCoordinator::progressOf(const std::string& id, ProgressSnapshot& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = transfers.find(id);
        if (it == transfers.end()) {
            return OpStatus::NOT_FOUND;
        }

        const TransferRecord& record = it->second.record;
        out.state = record.state;
        out.bytesTransferred = record.bytesTransferred;
        out.totalSizeBytes = record.resource.totalSizeBytes;
        out.progressRatio = record.progressRatio();
        out.instantaneousRate = record.state == TransferState::ACTIVE ? it->second.rate : 0.0;
        out.lastError = record.lastError;
        out.errorKind = record.errorKind;
        return OpStatus::OK;
    }

    std::optional<TransferRecord> TransferCoordinator::find(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = transfers.find(id);
        if (it == transfers.end()) {
            return std::nullopt;
        }
        return it->second.record;
    }

    std::vector<TransferRecord> TransferCoordinator::activeTransfers() const {
        std::vector<TransferRecord> result;
        for (auto& record : allTransfers()) {
            if (!record.isTerminal()) {
                result.push_back(std::move(record));
            }
        }
        return result;
    }

    std::vector<TransferRecord> TransferCoordinator::allTransfers() const {
        std::vector<std::pair<uint64_t, TransferRecord>> ordered;
        {
            std::lock_guard<std::mutex> lock(mtx);
            ordered.reserve(transfers.size());
            for (const auto& [id, entry] : transfers) {
                ordered.emplace_back(entry.sequence, entry.record);
            }
        }

        std::sort(ordered.begin(), ordered.end(),
                  [](const auto& first, const auto& second) { return first.first < second.first; });

        std::vector<TransferRecord> result;
        result.reserve(ordered.size());
        for (auto& [sequence, record] : ordered) {
            result.push_back(std::move(record));
        }
        return result;
    }

    TransferStats TransferCoordinator::statistics() const {
        std::lock_guard<std::mutex> lock(mtx);

        TransferStats stats;
        stats.total = initiatedCount;
        stats.completed = completedCount;
        stats.failed = failedCount;
        stats.cancelled = cancelledCount;
        stats.completedBytes = completedBytes;
        if (stats.total > 0) {
            stats.successRate = std::min(1.0, static_cast<double>(completedCount) / static_cast<double>(stats.total));
        }
        if (speedSamples > 0) {
            stats.averageSpeed = speedSum / static_cast<double>(speedSamples);
        }
        return stats;
    }

    // ============================================================
    //  PROBE
    // ============================================================

    std::future<bool> TransferCoordinator::probe(const std::string& peerId) {
        auto promise = std::make_shared<std::promise<bool>>();
        std::future<bool> result = promise->get_future();

        auto peer = registry.find(peerId);
        if (!peer) {
            promise->set_value(false);
            return result;
        }

        {
            std::lock_guard<std::mutex> lock(mtx);
            if (stopping) {
                promise->set_value(false);
                return result;
            }
        }

        boost::asio::post(*probePool, [this, promise, info = *peer]() {
            bool reachable = false;
            try {
                reachable = transport.probe(info, cfg.probeTimeout);
            } catch (const std::exception& e) {
                std::cerr << "Warning: Probe of " << info.id << " failed: " << e.what() << std::endl;
            }

            if (reachable) {
                registry.recordPong(info.id);
            } else {
                std::cout << "Info: Peer " << info.id << " unreachable, marking offline" << std::endl;
                registry.markOffline(info.id);
            }
            promise->set_value(reachable);
        });

        return result;
    }

    // ============================================================
    //  WORKER
    // ============================================================

    void TransferCoordinator::schedule(const std::string& id, uint64_t generation) {
        boost::asio::post(*transferPool, [this, id, generation]() {
            runTransfer(id, generation);
        });
    }

    void TransferCoordinator::runTransfer(const std::string& id, uint64_t generation) {
        std::string peerId;
        {
            std::lock_guard<std::mutex> lock(mtx);
            Entry* entry = findLocked(id, generation);
            if (entry == nullptr || stopping || entry->record.state != TransferState::PENDING) {
                return;
            }
            peerId = entry->record.peerId;
        }

        // The peer may have been pruned between initiate (or retry) and now
        auto peer = registry.find(peerId);
        if (!peer) {
            finish(id, generation, TransferState::PENDING, TransferState::FAILED,
                   ErrorKind::VALIDATION, "Peer " + peerId + " is no longer known");
            return;
        }

        TransferRecord snapshot;
        {
            std::lock_guard<std::mutex> lock(mtx);
            Entry* entry = findLocked(id, generation);
            if (entry == nullptr || entry->record.state != TransferState::PENDING) {
                return;
            }
            transitionLocked(*entry, TransferState::CONNECTING);
            snapshot = entry->record;
        }
        publish(snapshot, TransferEventType::STATE_CHANGED);

        ChannelRequest request;
        request.direction = snapshot.direction;
        request.transferId = snapshot.id;
        request.localPeerId = registry.localPeerId();
        request.resource = snapshot.resource;
        request.chunkSize = snapshot.chunkSize;

        auto session = std::make_shared<Session>();
        try {
            if (snapshot.direction == TransferDirection::OUTBOUND) {
                session->source = resources.openSource(snapshot.resource);
            } else {
                session->sink = resources.openSink(snapshot.resource);
            }
            session->channel = transport.open(*peer, request, cfg.connectTimeout);
        } catch (const TimeoutError& e) {
            finish(id, generation, TransferState::CONNECTING, TransferState::FAILED, ErrorKind::TIMEOUT, e.what());
            return;
        } catch (const std::exception& e) {
            finish(id, generation, TransferState::CONNECTING, TransferState::FAILED, ErrorKind::IO, e.what());
            return;
        }

        bool connected = false;
        {
            std::lock_guard<std::mutex> lock(mtx);
            Entry* entry = findLocked(id, generation);
            if (entry != nullptr && entry->record.state == TransferState::CONNECTING) {
                entry->session = session;
                transitionLocked(*entry, TransferState::ACTIVE);
                snapshot = entry->record;
                connected = true;
            }
        }

        if (!connected) {
            // Cancelled while the handshake was running
            sayGoodbye(*session);
            return;
        }

        publish(snapshot, TransferEventType::STATE_CHANGED);
        if (!streamChunks(id, generation, session)) {
            releaseSession(id, generation);
        }
    }

    void TransferCoordinator::continueTransfer(const std::string& id, uint64_t generation) {
        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(mtx);
            Entry* entry = findLocked(id, generation);
            if (entry == nullptr || !entry->session) {
                return;
            }
            session = entry->session;
        }

        if (!streamChunks(id, generation, session)) {
            releaseSession(id, generation);
        }
    }

    bool TransferCoordinator::streamChunks(const std::string& id, uint64_t generation,
                                           const std::shared_ptr<Session>& session) {
        TransferChannel& channel = *session->channel;
        std::vector<uint8_t> buffer;

        for (;;) {
            Step step;
            const Turn turn = nextTurn(id, generation, step);
            if (turn == Turn::PARKED) {
                return true;
            }
            if (turn == Turn::DONE) {
                channel.close();
                return false;
            }
            if (turn == Turn::STOPPED) {
                sayGoodbye(*session);
                return false;
            }

            uint64_t length = step.heldBytes;
            double seconds = 0.0;
            if (turn == Turn::GO) {
                const auto started = std::chrono::steady_clock::now();
                try {
                    length = moveChunk(*session, step, buffer);
                } catch (const std::exception& e) {
                    if (session->sink) {
                        session->sink->discard();
                    }
                    channel.close();
                    return failChunkLoop(id, generation, e.what());
                }
                seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            }

            switch (applyProgress(id, generation, length, seconds, session->sink.get())) {
                case Progress::MORE:
                    break;
                case Progress::FINISHED:
                    channel.close();
                    return false;
                case Progress::DROPPED:
                    // Cancelled while the chunk was in flight, its bytes do not count
                    if (session->sink) {
                        session->sink->discard();
                    }
                    channel.close();
                    return false;
            }
        }
    }

    uint64_t TransferCoordinator::moveChunk(Session& session, const Step& step, std::vector<uint8_t>& buffer) {
        const uint64_t left = step.total - step.offset;

        if (session.source) {
            const size_t want = static_cast<size_t>(std::min<uint64_t>(step.chunkSize, left));
            buffer.resize(want);
            const size_t got = session.source->read(buffer.data(), want);
            if (got == 0) {
                throw IoError("Unexpected end of resource at offset " + std::to_string(step.offset));
            }
            session.channel->sendChunk(step.offset, buffer.data(), got);
            return got;
        }

        session.channel->receiveChunk(step.offset, buffer);
        if (buffer.size() > left) {
            throw IoError("Peer sent more data than announced");
        }
        session.sink->write(buffer.data(), buffer.size());
        session.channel->acknowledge(step.offset, static_cast<uint32_t>(buffer.size()));
        return buffer.size();
    }

    TransferCoordinator::Turn TransferCoordinator::nextTurn(const std::string& id, uint64_t generation, Step& step) {
        std::lock_guard<std::mutex> lock(mtx);
        Entry* entry = findLocked(id, generation);
        if (entry == nullptr || stopping || entry->record.state == TransferState::CANCELLED) {
            return Turn::STOPPED;
        }

        TransferRecord& record = entry->record;
        if (record.state == TransferState::PAUSED) {
            entry->parked = true;
            return Turn::PARKED;
        }
        if (record.state != TransferState::ACTIVE) {
            return Turn::DONE;
        }

        if (entry->heldBytes > 0) {
            step.heldBytes = entry->heldBytes;
            entry->heldBytes = 0;
            return Turn::SETTLE;
        }
        if (record.bytesTransferred >= record.resource.totalSizeBytes) {
            return Turn::DONE;
        }

        step.offset = record.bytesTransferred;
        step.total = record.resource.totalSizeBytes;
        step.chunkSize = record.chunkSize;
        entry->chunkInFlight = true;
        return Turn::GO;
    }

    TransferCoordinator::Progress TransferCoordinator::applyProgress(const std::string& id, uint64_t generation,
                                                                     uint64_t bytes, double seconds, ChunkSink* sink) {
        TransferRecord snapshot;
        Progress outcome = Progress::MORE;
        {
            std::lock_guard<std::mutex> lock(mtx);
            Entry* entry = findLocked(id, generation);
            if (entry == nullptr) {
                return Progress::DROPPED;
            }

            entry->chunkInFlight = false;
            TransferRecord& record = entry->record;
            if (record.state != TransferState::ACTIVE && record.state != TransferState::PAUSED) {
                return Progress::DROPPED;
            }

            const uint64_t total = record.resource.totalSizeBytes;
            assert(record.bytesTransferred + bytes <= total);
            const uint64_t reached = std::min(total, record.bytesTransferred + bytes);
            entry->rate = seconds > 0.0 ? static_cast<double>(bytes) / seconds : 0.0;

            if (reached < total) {
                record.bytesTransferred = reached;
            } else if (record.state == TransferState::PAUSED) {
                // Only completed transfers may show the full size; settle on resume
                entry->heldBytes = reached - record.bytesTransferred;
                return Progress::MORE;
            } else {
                // Commit and completion happen under one lock so a cancel cannot land between them
                try {
                    if (sink != nullptr) {
                        sink->commit();
                    }
                    record.bytesTransferred = reached;
                    transitionLocked(*entry, TransferState::COMPLETED);
                } catch (const std::exception& e) {
                    if (sink != nullptr) {
                        sink->discard();
                    }
                    transitionLocked(*entry, TransferState::FAILED);
                    record.lastError = e.what();
                    record.errorKind = ErrorKind::IO;
                    entry->rate = 0.0;
                }
                recordTerminalLocked(*entry);
                outcome = Progress::FINISHED;
            }
            snapshot = record;
        }

        if (outcome != Progress::FINISHED) {
            publish(snapshot, TransferEventType::PROGRESS);
            return outcome;
        }

        if (snapshot.state == TransferState::COMPLETED) {
            std::cout << "Info: Transfer " << id << " completed (" << snapshot.bytesTransferred
                      << " bytes in " << snapshot.durationSeconds() << " s)" << std::endl;
        } else {
            std::cerr << "Error: Transfer " << id << " failed (io): " << snapshot.lastError << std::endl;
        }
        appendHistory(snapshot);
        publish(snapshot, TransferEventType::STATE_CHANGED);
        return outcome;
    }

    bool TransferCoordinator::failChunkLoop(const std::string& id, uint64_t generation, const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            Entry* entry = findLocked(id, generation);
            if (entry == nullptr) {
                return false;
            }

            entry->chunkInFlight = false;
            if (entry->record.state == TransferState::PAUSED) {
                // paused -> failed is not a legal move; hold the error until resume or cancel
                entry->heldError = error;
                entry->parked = true;
                entry->session.reset();
                return true;
            }
            if (entry->record.state != TransferState::ACTIVE) {
                return false;
            }
        }

        finish(id, generation, TransferState::ACTIVE, TransferState::FAILED, ErrorKind::IO, error);
        return false;
    }

    void TransferCoordinator::releaseSession(const std::string& id, uint64_t generation) {
        std::lock_guard<std::mutex> lock(mtx);
        Entry* entry = findLocked(id, generation);
        if (entry != nullptr && !entry->parked) {
            entry->session.reset();
        }
    }

    void TransferCoordinator::sayGoodbye(Session& session) {
        if (session.sink) {
            session.sink->discard();
        }
        if (session.channel) {
            session.channel->cancel("Transfer cancelled");
        }
    }

    void TransferCoordinator::finish(const std::string& id, uint64_t generation, TransferState from,
                                     TransferState to, ErrorKind kind, const std::string& error) {
        TransferRecord snapshot;
        {
            std::lock_guard<std::mutex> lock(mtx);
            Entry* entry = findLocked(id, generation);
            if (entry == nullptr || entry->record.state != from) {
                return;
            }
            if (!transitionLocked(*entry, to)) {
                return;
            }

            entry->record.lastError = error;
            entry->record.errorKind = kind;
            entry->rate = 0.0;
            recordTerminalLocked(*entry);
            snapshot = entry->record;
        }

        if (to == TransferState::FAILED) {
            std::cerr << "Error: Transfer " << id << " failed (" << errorKindToString(kind) << "): "
                      << error << std::endl;
        }

        if (snapshot.isTerminal()) {
            appendHistory(snapshot);
        }
        publish(snapshot, TransferEventType::STATE_CHANGED);
    }

    // ============================================================
    //  HELPERS
    // ============================================================

    bool TransferCoordinator::transitionLocked(Entry& entry, TransferState to) {
        if (!isLegalTransition(entry.record.state, to)) {
            return false;
        }

        entry.record.state = to;
        if (isTerminalState(to)) {
            entry.record.endedAt = Clock::now();
        }
        return true;
    }

    void TransferCoordinator::recordTerminalLocked(const Entry& entry) {
        const TransferRecord& record = entry.record;
        switch (record.state) {
            case TransferState::COMPLETED: {
                ++completedCount;
                completedBytes += record.resource.totalSizeBytes;
                const double seconds = record.durationSeconds();
                if (seconds > 0.0) {
                    speedSum += static_cast<double>(record.resource.totalSizeBytes) / seconds;
                    ++speedSamples;
                }
                break;
            }
            case TransferState::FAILED:
                ++failedCount;
                break;
            case TransferState::CANCELLED:
                ++cancelledCount;
                break;
            default:
                break;
        }
    }

    TransferCoordinator::Entry* TransferCoordinator::findLocked(const std::string& id, uint64_t generation) {
        auto it = transfers.find(id);
        if (it == transfers.end() || it->second.generation != generation) {
            return nullptr;
        }
        return &it->second;
    }

    void TransferCoordinator::appendHistory(const TransferRecord& record) {
        if (!history.append(record)) {
            std::cerr << "Warning: Could not persist transfer " << record.id << " to history" << std::endl;
        }
    }

    TransferCoordinator::ListenerId TransferCoordinator::subscribe(Listener listener) {
        std::lock_guard<std::mutex> lock(listenerMtx);
        const ListenerId id = nextListenerId++;
        listeners.emplace_back(id, std::move(listener));
        return id;
    }

    void TransferCoordinator::unsubscribe(ListenerId id) {
        std::lock_guard<std::mutex> lock(listenerMtx);
        listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                       [id](const auto& entry) { return entry.first == id; }),
                        listeners.end());
    }

    void TransferCoordinator::publish(const TransferRecord& record, TransferEventType type) {
        TransferEvent event;
        event.type = type;
        event.record = record;
        notify(event);
    }

    void TransferCoordinator::notify(const TransferEvent& event) const {
        std::vector<Listener> copy;
        {
            std::lock_guard<std::mutex> lock(listenerMtx);
            copy.reserve(listeners.size());
            for (const auto& entry : listeners) {
                copy.push_back(entry.second);
            }
        }

        for (const auto& listener : copy) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                std::cerr << "Error in transfer listener: " << e.what() << std::endl;
            }
        }
    }

} // namespace airlink
