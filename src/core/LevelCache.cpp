// ========================= src/core/LevelCache.cpp =========================
#include "LevelCache.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace lp {

    LevelCache::LevelCache(GenOptions opt)
        :producer([opt](int level) { return Generator(opt).makeLevel(level); }) {}

    LevelCache::LevelCache(Producer p) :producer(std::move(p)) {
        if (!producer) throw std::invalid_argument("LevelCache: empty producer");
    }

    LevelCache::~LevelCache() {
        std::vector<Worker> pending;
        {
            std::lock_guard<std::mutex> lock(mtx);
            pending.swap(workers);
            slots.clear();
        }
        for (auto& w : pending) if (w.thread.joinable()) w.thread.join();
    }

    void LevelCache::reapFinishedLocked() {
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                if (it->thread.joinable()) it->thread.join();
                it = workers.erase(it);
            }
            else ++it;
        }
    }

    std::shared_future<GenerationResult> LevelCache::request(int level) {
        if (level < 1) throw std::invalid_argument("LevelCache: level must be >= 1");
        std::lock_guard<std::mutex> lock(mtx);
        reapFinishedLocked();
        auto it = slots.find(level);
        if (it != slots.end()) return it->second;

        std::packaged_task<GenerationResult()> task([this, level]() { return producer(level); });
        std::shared_future<GenerationResult> fut = task.get_future().share();
        slots.emplace(level, fut);
        ++started;
        spdlog::debug("level cache: background generation for level {}", level);
        workers.push_back(Worker{ std::thread(std::move(task)), fut });
        return fut;
    }

    GenerationResult LevelCache::take(int level) {
        if (level < 1) throw std::invalid_argument("LevelCache: level must be >= 1");
        std::shared_future<GenerationResult> fut;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = slots.find(level);
            if (it != slots.end()) {
                fut = it->second;
                slots.erase(it);
            }
        }
        if (fut.valid()) return fut.get();

        spdlog::debug("level cache: miss for level {}, generating in place", level);
        ++started;
        return producer(level);
    }

    void LevelCache::discard(int level) {
        std::lock_guard<std::mutex> lock(mtx);
        slots.erase(level);
    }

    bool LevelCache::isPending(int level) const {
        std::lock_guard<std::mutex> lock(mtx);
        return slots.count(level) != 0;
    }

    bool LevelCache::isReady(int level) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = slots.find(level);
        return it != slots.end() && it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

} // namespace lp
