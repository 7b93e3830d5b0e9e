// ========================= src/ui/App.hpp =========================
#pragma once
#include "../core/LevelCache.hpp"
#include "../core/Session.hpp"
#include "../io/Csv.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace lp {

    class AppUI {
    public:
        AppUI();
        ~AppUI();
        int run(); // SDL2 + ImGui main loop

    private:
        GenOptions opt; int startLevel{ 1 }; int NtoGenerate{ 5 };
        int saltInput{ 0 };
        std::vector<GenerationResult> generated; // in-memory pool
        int currentIndex{ -1 };
        int viewIndexInput{ 1 };
        int playbackStep{ 0 };
        char savePath[256]{ "levels.csv" };
        char loadPath[256]{ "levels.csv" };

        // Play mode on the selected level
        std::unique_ptr<PlaySession> session;
        std::string lastTap;
        int hintId{ -1 };
        double deadlockEstimate{ -1 };

        // Next-level prefetch
        std::unique_ptr<LevelCache> cache;
        int prefetchLevel{ 1 };

        // Background batch generation
        std::thread generationThread;
        std::atomic<bool> isGenerating{ false };
        std::atomic<int> generationCompleted{ 0 };
        int generationTotal{ 0 };
        std::mutex pendingMutex;
        std::vector<GenerationResult> pendingGenerated;
        std::mutex statusMutex;
        std::string statusMessage;

        void drawTopBar();
        void drawViewer();
        void drawDiagnostics();

        void ensureIndex(int idx);
        void collectGenerated();
        void startBatch();
        void resetCache();
        void setStatus(const std::string& msg);
        std::string getStatus();
    };

} // namespace lp
