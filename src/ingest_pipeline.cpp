#include "ingest_pipeline.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace prodsearch {

const char* toString(IngestionPipeline::State state) {
    switch (state) {
        case IngestionPipeline::State::Idle:         return "Idle";
        case IngestionPipeline::State::Loading:      return "Loading";
        case IngestionPipeline::State::Encoding:     return "Encoding";
        case IngestionPipeline::State::Upserting:    return "Upserting";
        case IngestionPipeline::State::Checkpointed: return "Checkpointed";
        case IngestionPipeline::State::BatchFailed:  return "BatchFailed";
    }
    return "?";
}

IngestionPipeline::IngestionPipeline(CatalogSource& catalog,
                                     EmbeddingProvider& embedder,
                                     VectorStore& store,
                                     CheckpointFile& checkpoint,
                                     Options options)
    : mCatalog(catalog)
    , mEmbedder(embedder)
    , mStore(store)
    , mCheckpoint(checkpoint)
    , mOptions(std::move(options))
{
    if (mOptions.batchSize == 0) {
        throw std::invalid_argument("IngestionPipeline: batchSize must be > 0");
    }
    if (mOptions.collection.empty()) {
        throw std::invalid_argument("IngestionPipeline: collection name is empty");
    }
}

IngestionPipeline::~IngestionPipeline() {
    stop();
}

void IngestionPipeline::prepare() {
    mStore.ensureCollection(mOptions.collection, mOptions.vectorSize);
}

// ---------------------------------------------------------------------------
// One pass
// ---------------------------------------------------------------------------

IngestionPipeline::PassStats IngestionPipeline::runPass() {
    PassStats pass;

    const auto records = mCatalog.load();
    const std::size_t start = mCheckpoint.load();

    pass.catalogSize = records.size();
    pass.startOffset = start;
    pass.checkpoint  = start;

    if (start > records.size()) {
        std::cerr << "[IngestionPipeline] Warning: checkpoint " << start
                  << " is past the end of the catalog (" << records.size()
                  << " records); nothing to do\n";
    }

    const std::size_t totalBatches =
        (records.size() + mOptions.batchSize - 1) / mOptions.batchSize;

    // After the first failure the checkpoint must not move past the failed batch.
    bool checkpointBlocked = false;

    for (std::size_t begin = start; begin < records.size(); begin += mOptions.batchSize) {
        if (mStopRequested.load()) {
            break;
        }
        const std::size_t end = std::min(begin + mOptions.batchSize, records.size());

        try {
            const int written = processBatch(records, begin, end);
            pass.pointsUpserted += written;
            ++pass.batchesOk;

            if (!checkpointBlocked) {
                mCheckpoint.save(end);
                pass.checkpoint = end;
                setState(State::Checkpointed, begin);
            }

            if (mOptions.verbose) {
                std::cerr << "[IngestionPipeline] Batch "
                          << (begin / mOptions.batchSize + 1) << "/" << totalBatches
                          << " [" << begin << ", " << end << ") stored "
                          << written << " points\n";
            }
        } catch (const std::exception& e) {
            setState(State::BatchFailed, begin);
            ++pass.batchesFailed;
            checkpointBlocked = true;
            std::cerr << "[IngestionPipeline] Error processing batch " << begin
                      << ": " << e.what() << "\n";
        }
    }

    setState(State::Idle, pass.checkpoint);

    {
        std::lock_guard<std::mutex> lock(mStatsMutex);
        ++mStats.passes;
        mStats.totalBatchesOk      += pass.batchesOk;
        mStats.totalBatchesFailed  += pass.batchesFailed;
        mStats.totalPointsUpserted += pass.pointsUpserted;
        mStats.lastPass             = pass;
    }
    return pass;
}

int IngestionPipeline::processBatch(const std::vector<nlohmann::json>& records,
                                    std::size_t begin, std::size_t end) {
    setState(State::Loading, begin);

    std::vector<ProductPayload> payloads;
    payloads.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        try {
            payloads.push_back(parseProductRecord(records[i]));
        } catch (const std::exception& e) {
            throw CatalogError("Record " + std::to_string(i) + ": " + e.what());
        }
    }

    // Flatten every image of the batch into one call and remember its owner.
    setState(State::Encoding, begin);

    std::vector<std::string> urls;
    std::vector<std::size_t> owners;
    for (std::size_t p = 0; p < payloads.size(); ++p) {
        if (payloads[p].images.empty()) {
            throw EncodingError("Product " + std::to_string(payloads[p].id) +
                                " has no images");
        }
        for (const auto& url : payloads[p].images) {
            urls.push_back(url);
            owners.push_back(p);
        }
    }

    const auto vectors = mEmbedder.encodeImages(urls);

    std::vector<std::vector<const Vector*>> perProduct(payloads.size());
    for (std::size_t j = 0; j < vectors.size(); ++j) {
        perProduct[owners[j]].push_back(&vectors[j]);
    }

    std::vector<ProductPoint> points;
    points.reserve(payloads.size());
    for (std::size_t p = 0; p < payloads.size(); ++p) {
        ProductPoint point;
        point.id      = payloads[p].id;
        point.vector  = *perProduct[p].front();
        point.payload = std::move(payloads[p]);
        points.push_back(std::move(point));
    }

    setState(State::Upserting, begin);
    mStore.upsert(mOptions.collection, points);

    return static_cast<int>(points.size());
}

// ---------------------------------------------------------------------------
// Scheduling
// ---------------------------------------------------------------------------

void IngestionPipeline::start() {
    if (mThread.joinable()) {
        throw std::logic_error("IngestionPipeline already started");
    }
    prepare();
    mStopRequested.store(false);
    mThread = std::thread([this] { loop(); });
}

void IngestionPipeline::stop() {
    {
        std::lock_guard<std::mutex> lock(mWaitMutex);
        mStopRequested.store(true);
    }
    mWake.notify_all();
    if (mThread.joinable()) {
        mThread.join();
    }
}

void IngestionPipeline::run() {
    prepare();
    loop();
}

void IngestionPipeline::loop() {
    while (!mStopRequested.load()) {
        try {
            const auto pass = runPass();
            std::cerr << "[IngestionPipeline] Pass complete: " << pass.batchesOk
                      << " batches ok, " << pass.batchesFailed << " failed, checkpoint "
                      << pass.checkpoint << "/" << pass.catalogSize << "\n";
        } catch (const Error& e) {
            // Catalog or checkpoint unreadable: try again next cycle.
            std::cerr << "[IngestionPipeline] Pass aborted: " << e.what() << "\n";
        } catch (const std::exception& e) {
            // Any other CatalogSource or store failure must not end the worker.
            std::cerr << "[IngestionPipeline] Pass aborted: " << e.what() << "\n";
        }

        std::unique_lock<std::mutex> lock(mWaitMutex);
        if (mOptions.verbose) {
            std::cerr << "[IngestionPipeline] Waiting for new data...\n";
        }
        mWake.wait_for(lock, mOptions.pollInterval,
                       [this] { return mStopRequested.load(); });
    }
    setState(State::Idle, 0);
}

void IngestionPipeline::setState(State s, std::size_t batchStart) {
    mState.store(s);
    if (mOptions.verbose && s != State::Idle) {
        std::cerr << "[IngestionPipeline] batch " << batchStart << ": "
                  << toString(s) << "\n";
    }
}

IngestionPipeline::Stats IngestionPipeline::getStats() const {
    std::lock_guard<std::mutex> lock(mStatsMutex);
    return mStats;
}

} // namespace prodsearch
