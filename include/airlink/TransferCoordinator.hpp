#ifndef AIRLINK_TRANSFER_COORDINATOR_HPP
#define AIRLINK_TRANSFER_COORDINATOR_HPP

#include "Transfer.hpp"
#include "PeerRegistry.hpp"
#include "PeerTransport.hpp"
#include "ResourceIO.hpp"
#include "TransferHistory.hpp"
#include "Types.hpp"
#include <boost/asio/thread_pool.hpp>
#include <unordered_map>
#include <functional>
#include <optional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace airlink {

    struct CoordinatorConfig {
        std::chrono::milliseconds connectTimeout = DEFAULT_CONNECT_TIMEOUT;
        std::chrono::milliseconds probeTimeout = DEFAULT_PROBE_TIMEOUT;
        size_t maxConcurrentTransfers = DEFAULT_MAX_CONCURRENT_TRANSFERS;
        size_t probeThreads = DEFAULT_PROBE_THREADS;
    };

    enum class TransferEventType : uint8_t {
        CREATED,
        STATE_CHANGED,
        PROGRESS,
        REMOVED
    };

    struct TransferEvent {
        TransferEventType type = TransferEventType::CREATED;
        TransferRecord record;
    };

    /**
     * Owns every transfer and drives it through
     *   pending -> connecting -> active -> (paused <-> active) -> completed
     * with failed / cancelled exits and failed -> pending on retry.
     *
     * Control calls never block on the network: chunk loops run on a bounded worker
     * pool, probes on a second small pool. A paused loop parks its session on the entry
     * and gives its thread back; resume schedules it again. State lives behind one
     * mutex that is never held across network I/O or while listeners run.
     */
    class TransferCoordinator {
        public:
            using Listener = std::function<void(const TransferEvent&)>;
            using ListenerId = uint64_t;

            TransferCoordinator(PeerRegistry& registry,
                                PeerTransport& transport,
                                ResourceProvider& resources,
                                TransferHistory& history,
                                CoordinatorConfig config = CoordinatorConfig());
            ~TransferCoordinator();

            TransferCoordinator(const TransferCoordinator&) = delete;
            TransferCoordinator& operator=(const TransferCoordinator&) = delete;

            /**
             * Validates the counterpart peer and the resource, creates a pending transfer
             * and queues it. On any validation failure nothing is created.
             *
             * @param direction OUTBOUND pushes the resource to toPeerId, INBOUND pulls it
             *                  from fromPeerId.
             * @param outId     Receives the new transfer id on success.
             */
            OpStatus initiate(const ResourceDescriptor& resource,
                              const std::string& fromPeerId,
                              const std::string& toPeerId,
                              TransferDirection direction,
                              std::string& outId);

            OpStatus pause(const std::string& id);
            OpStatus resume(const std::string& id);
            OpStatus cancel(const std::string& id);
            OpStatus retry(const std::string& id);

            OpStatus progressOf(const std::string& id, ProgressSnapshot& out) const;
            std::optional<TransferRecord> find(const std::string& id) const;

            // Cancels the transfer when it is still live, then forgets it
            OpStatus remove(const std::string& id);
            size_t clearFinished();

            std::vector<TransferRecord> activeTransfers() const;
            std::vector<TransferRecord> allTransfers() const;
            TransferStats statistics() const;

            /**
             * Sends a liveness ping to a known peer. Resolves to true on a matching pong
             * within the probe timeout; the registry is updated through recordPong or
             * markOffline. Unknown peers resolve to false and change nothing.
             */
            std::future<bool> probe(const std::string& peerId);

            ListenerId subscribe(Listener listener);
            void unsubscribe(ListenerId id);

            /** Cancels live transfers and waits for the worker pools. Idempotent. */
            void shutdown();

            const CoordinatorConfig& config() const { return cfg; }

        private:
            // Everything a connected transfer needs to move its next chunk
            struct Session {
                std::shared_ptr<TransferChannel> channel;
                std::unique_ptr<ChunkSource> source;
                std::unique_ptr<ChunkSink> sink;
            };

            struct Entry {
                TransferRecord record;
                uint64_t sequence = 0;
                uint64_t generation = 0; // bumped on retry, stale jobs bail out
                std::shared_ptr<Session> session;
                double rate = 0.0;
                bool chunkInFlight = false;
                bool parked = false;     // paused with no worker attached
                uint64_t heldBytes = 0;  // final chunk landed while paused
                std::string heldError;   // chunk failed while paused
            };

            struct Step {
                uint64_t offset = 0;
                uint64_t total = 0;
                uint32_t chunkSize = 0;
                uint64_t heldBytes = 0;
            };

            enum class Turn {
                GO,        // send / receive the next chunk
                SETTLE,    // apply bytes held back while paused
                PARKED,    // paused, the worker returns to the pool
                DONE,      // the job no longer owns the transfer
                STOPPED    // cancelled or shutting down
            };

            enum class Progress {
                MORE,
                FINISHED,  // completed, or failed to commit
                DROPPED    // cancelled while the chunk was in flight
            };

            PeerRegistry& registry;
            PeerTransport& transport;
            ResourceProvider& resources;
            TransferHistory& history;
            CoordinatorConfig cfg;

            mutable std::mutex mtx;
            std::unordered_map<std::string, Entry> transfers;
            uint64_t nextSequence = 0;
            bool stopping = false;

            // Cumulative counters, they survive remove() and clearFinished()
            size_t initiatedCount = 0;
            size_t completedCount = 0;
            size_t failedCount = 0;
            size_t cancelledCount = 0;
            uint64_t completedBytes = 0;
            double speedSum = 0.0;
            size_t speedSamples = 0;

            mutable std::mutex listenerMtx;
            std::vector<std::pair<ListenerId, Listener>> listeners;
            ListenerId nextListenerId = 1;

            std::unique_ptr<boost::asio::thread_pool> transferPool;
            std::unique_ptr<boost::asio::thread_pool> probePool;

            void schedule(const std::string& id, uint64_t generation);
            void runTransfer(const std::string& id, uint64_t generation);
            void continueTransfer(const std::string& id, uint64_t generation);

            // Returns true when the loop parked its session on the entry
            bool streamChunks(const std::string& id, uint64_t generation, const std::shared_ptr<Session>& session);
            uint64_t moveChunk(Session& session, const Step& step, std::vector<uint8_t>& buffer);

            Turn nextTurn(const std::string& id, uint64_t generation, Step& step);
            Progress applyProgress(const std::string& id, uint64_t generation,
                                   uint64_t bytes, double seconds, ChunkSink* sink);
            bool failChunkLoop(const std::string& id, uint64_t generation, const std::string& error);
            void releaseSession(const std::string& id, uint64_t generation);
            void finish(const std::string& id, uint64_t generation, TransferState from,
                        TransferState to, ErrorKind kind, const std::string& error);

            static void sayGoodbye(Session& session);

            // Callers hold mtx
            bool transitionLocked(Entry& entry, TransferState to);
            void recordTerminalLocked(const Entry& entry);
            Entry* findLocked(const std::string& id, uint64_t generation);

            void appendHistory(const TransferRecord& record);
            void publish(const TransferRecord& record, TransferEventType type);
            void notify(const TransferEvent& event) const;
    };

} // namespace airlink

#endif // AIRLINK_TRANSFER_COORDINATOR_HPP
