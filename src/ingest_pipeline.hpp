#pragma once

#include "catalog.hpp"
#include "checkpoint.hpp"
#include "embedding.hpp"
#include "models.hpp"
#include "vector_store.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace prodsearch {

/// Keeps a vector collection in sync with a growing product catalog.
///
/// Every pass re-reads the catalog and resumes at the persisted checkpoint,
/// processing fixed-size batches: encode all images of the batch at once,
/// take each product's first image vector, upsert, move the checkpoint.
/// A failed batch is logged and skipped for this pass; from then on the
/// checkpoint stays put, so the failed batch is retried on the next pass.
class IngestionPipeline {
public:
    enum class State { Idle, Loading, Encoding, Upserting, Checkpointed, BatchFailed };

    struct Options {
        std::string               collection;
        std::size_t               batchSize    = 10;
        std::size_t               vectorSize   = kVectorSize;
        std::chrono::milliseconds pollInterval = std::chrono::seconds(60);
        bool                      verbose      = false;
    };

    struct PassStats {
        std::size_t catalogSize    = 0;
        std::size_t startOffset    = 0;
        std::size_t checkpoint     = 0;
        int         batchesOk      = 0;
        int         batchesFailed  = 0;
        int         pointsUpserted = 0;
    };

    struct Stats {
        int       passes              = 0;
        int       totalBatchesOk      = 0;
        int       totalBatchesFailed  = 0;
        int       totalPointsUpserted = 0;
        PassStats lastPass{};
    };

    IngestionPipeline(CatalogSource& catalog,
                      EmbeddingProvider& embedder,
                      VectorStore& store,
                      CheckpointFile& checkpoint,
                      Options options);
    ~IngestionPipeline();

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;

    /// Make sure the target collection exists.
    void prepare();

    /// One pass over the catalog from the persisted checkpoint.
    /// @throws CatalogError / CheckpointError if the pass cannot start.
    PassStats runPass();

    /// prepare(), then run passes on a background thread until stop().
    void start();

    /// Signal the background loop and wait for it.  Interrupts the wait
    /// between passes; a batch in flight finishes first.
    void stop();

    /// prepare(), then run passes on the calling thread until stop().
    /// Returns after prepare() if stop() was already called; only start()
    /// clears a pending stop.
    void run();

    bool running() const { return mThread.joinable() && !mStopRequested.load(); }
    State state() const { return mState.load(); }
    Stats getStats() const;

private:
    CatalogSource&     mCatalog;
    EmbeddingProvider& mEmbedder;
    VectorStore&       mStore;
    CheckpointFile&    mCheckpoint;
    Options            mOptions;

    std::atomic<State> mState{State::Idle};
    std::atomic<bool>  mStopRequested{false};
    std::mutex         mWaitMutex;
    std::condition_variable mWake;
    std::thread        mThread;

    mutable std::mutex mStatsMutex;
    Stats              mStats{};

    void loop();
    void setState(State s, std::size_t batchStart);

    /// Encode and upsert records [begin, end).  Returns the number of points written.
    int processBatch(const std::vector<nlohmann::json>& records,
                     std::size_t begin, std::size_t end);
};

const char* toString(IngestionPipeline::State state);

} // namespace prodsearch
