///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_optimizer.hpp"
#include <algorithm>
#include <future>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Scan a candidate range in parallel chunks.
 *
 * Chunks are balanced (sizes differ by at most one) and launched with
 * std::async; the first chunk runs on the calling thread. The reduction walks
 * the chunk results in index order, so ties resolve to the lowest index.
 */
MoveChoice parallelBestInRange(const Neighborhood& nb, int begin, int end, int numThreads, int minParallel) {
    begin = std::max(begin, 0);
    end = std::min(end, nb.size());
    int total = end - begin;
    if (total <= 0) return MoveChoice();
    if (numThreads <= 1 || total < minParallel) {
        return nb.bestInRange(begin, end);
    }

    int chunks = std::min(numThreads, total);
    int base = total / chunks, extra = total % chunks;

    std::vector<std::future<MoveChoice>> tasks;
    tasks.reserve(chunks - 1);

    int firstEnd = begin + base + (extra > 0 ? 1 : 0);
    int chunkBegin = firstEnd;
    for (int c = 1; c < chunks; ++c) {
        int chunkEnd = chunkBegin + base + (c < extra ? 1 : 0);
        tasks.push_back(std::async(std::launch::async,
                                   [&nb, chunkBegin, chunkEnd]() { return nb.bestInRange(chunkBegin, chunkEnd); }));
        chunkBegin = chunkEnd;
    }

    MoveChoice best = nb.bestInRange(begin, firstEnd);
    for (auto& t : tasks) {
        MoveChoice local = t.get();
        if (local.betterThan(best)) best = local;
    }
    return best;
}


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
ThreadedOptimizer::ThreadedOptimizer(const EngineConfig& config)
        : LocalSearchOptimizer(config) {}

MoveChoice ThreadedOptimizer::selectMove(const Neighborhood& nb) const {
    return parallelBestInRange(nb, 0, nb.size(), config().numThreads, kMinParallelCandidates);
}
