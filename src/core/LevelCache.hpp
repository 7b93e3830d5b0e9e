// ========================= src/core/LevelCache.hpp =========================
#pragma once
#include "Generator.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace lp {

    // Per-level result cache fed by background workers.
    // - request(): single-flight; a second request for the same level gets the in-flight future.
    // - take(): one-shot; hands the result over and forgets it, so the next request regenerates.
    //   A miss generates synchronously on the caller's thread.
    // A prefetched level that is never taken just finishes and is dropped with the cache.
    class LevelCache {
    public:
        using Producer = std::function<GenerationResult(int level)>;

        explicit LevelCache(GenOptions opt = {});
        explicit LevelCache(Producer producer);
        LevelCache(const LevelCache&) = delete;
        LevelCache& operator=(const LevelCache&) = delete;
        ~LevelCache();

        std::shared_future<GenerationResult> request(int level);
        void prefetch(int level) { request(level); }
        GenerationResult take(int level);
        void discard(int level);

        bool isPending(int level) const;   // in flight or ready, not yet taken
        bool isReady(int level) const;
        int generationsStarted() const { return started.load(); }

    private:
        struct Worker { std::thread thread; std::shared_future<GenerationResult> done; };

        Producer producer;
        mutable std::mutex mtx;
        std::unordered_map<int, std::shared_future<GenerationResult>> slots;
        std::vector<Worker> workers;
        std::atomic<int> started{ 0 };

        void reapFinishedLocked();
    };

} // namespace lp
