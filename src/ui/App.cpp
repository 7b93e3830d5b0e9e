// ========================= src/ui/App.cpp =========================
#include "App.hpp"
#include "../core/Detector.hpp"
#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"
#include <spdlog/spdlog.h>
#include <algorithm> // for std::clamp
#include <cmath>
#include <cstdint>
#include <string>

namespace lp {

    AppUI::AppUI() {
        opt.honorTimeBudget = true;
        resetCache();
    }

    AppUI::~AppUI() {
        if (generationThread.joinable()) {
            generationThread.join();
        }
    }

    void AppUI::setStatus(const std::string& msg) {
        std::lock_guard<std::mutex> lock(statusMutex);
        statusMessage = msg;
    }

    std::string AppUI::getStatus() {
        std::lock_guard<std::mutex> lock(statusMutex);
        return statusMessage;
    }

    void AppUI::resetCache() {
        cache = std::make_unique<LevelCache>(opt);
    }

    void AppUI::ensureIndex(int idx) {
        if (idx >= 0 && idx < (int)generated.size()) {
            currentIndex = idx;
            viewIndexInput = idx + 1;
            playbackStep = 0;
            session.reset();
            lastTap.clear();
            hintId = -1;
            deadlockEstimate = -1;
        }
    }

    void AppUI::collectGenerated() {
        if (!isGenerating.load() && generationThread.joinable()) {
            generationThread.join();
            generationTotal = 0;
            generationCompleted.store(0);
        }

        std::vector<GenerationResult> newly;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            if (!pendingGenerated.empty()) {
                newly.swap(pendingGenerated);
            }
        }

        if (!newly.empty()) {
            bool hadAny = !generated.empty();
            for (auto& g : newly) {
                generated.push_back(std::move(g));
            }
            if (currentIndex < 0 || !hadAny) ensureIndex(0);
        }
    }

    void AppUI::startBatch() {
        GenOptions optCopy = opt;
        int first = startLevel;
        int count = NtoGenerate;
        setStatus("");

        if (generationThread.joinable()) generationThread.join();
        generationTotal = count;
        generationCompleted.store(0);
        isGenerating.store(true);

        generationThread = std::thread([this, optCopy, first, count]() {
            Generator localGen(optCopy);
            std::string status;
            int failed = 0;
            for (int i = 0; i < count; ++i) {
                try {
                    auto g = localGen.makeLevel(first + i);
                    if (!g.solvable) ++failed;
                    std::lock_guard<std::mutex> lock(pendingMutex);
                    pendingGenerated.push_back(std::move(g));
                }
                catch (const std::exception& e) {
                    spdlog::error("batch generation stopped at level {}: {}", first + i, e.what());
                    status = std::string("Generation failed: ") + e.what();
                    break;
                }
                generationCompleted.fetch_add(1);
            }
            if (status.empty() && failed > 0) status = std::to_string(failed) + " level(s) came back unsolvable.";
            setStatus(status);
            isGenerating.store(false);
        });
    }

    static bool InputIntClamped(const char* label, int* value, int minValue, int maxValue, int step = 1, int stepFast = 5) {
        if (minValue > maxValue) std::swap(minValue, maxValue);
        int before = *value;
        bool interacted = ImGui::InputInt(label, value, step, stepFast);
        if (*value < minValue) *value = minValue;
        if (*value > maxValue) *value = maxValue;

        return interacted || *value != before;
    }

    void AppUI::drawTopBar() {
        collectGenerated();

        ImGui::Begin("Controls");
        ImGui::Text("Board");
        bool optChanged = false;
        int w = (int)opt.board.width, h = (int)opt.board.height;
        if (InputIntClamped("Screen width", &w, 120, 2048, 2, 20)) { opt.board.width = (float)w; optChanged = true; }
        if (InputIntClamped("Screen height", &h, 260, 4096, 2, 20)) { opt.board.height = (float)h; optChanged = true; }
        if (InputIntClamped("Seed salt", &saltInput, 0, 1 << 20)) { opt.salt = (uint32_t)saltInput; optChanged = true; }
        if (ImGui::Checkbox("Honor time budget", &opt.honorTimeBudget)) optChanged = true;
        if (ImGui::IsItemHovered()) ImGui::SetTooltip("Off = attempt budget only, same board for the same level and salt.");
        if (optChanged) resetCache();

        ImGui::Separator();
        ImGui::Text("Generator");
        InputIntClamped("Start level", &startLevel, 1, 100000, 1, 10);
        InputIntClamped("Count (N)", &NtoGenerate, 1, 100);
        auto params = parametersForLevel(startLevel);
        ImGui::TextDisabled("%s%s  pieces %d..%d  block %.1f  target %.0f+-%.0f",
            phaseName(params.phase), params.isReliefLevel ? " (relief)" : "",
            params.pieceCountMin, params.pieceCountMax, params.shortSide, params.targetDifficulty, params.difficultyTolerance);

        bool currentlyGenerating = isGenerating.load();
        if (currentlyGenerating) ImGui::BeginDisabled();
        if (ImGui::Button("Generate N")) startBatch();
        if (currentlyGenerating) ImGui::EndDisabled();

        if (isGenerating.load()) {
            ImGui::SameLine();
            int total = generationTotal;
            int done = generationCompleted.load();
            if (total < 1) total = 1;
            if (done > total) done = total;
            ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "Generating Levels... %d/%d", done, total);
        }

        std::string status = getStatus();
        if (!status.empty()) {
            ImGui::TextColored(ImVec4(0.9f, 0.6f, 0.5f, 1.0f), "%s", status.c_str());
        }

        ImGui::SameLine();
        if (ImGui::Button("Clear Memory")) {
            generated.clear();
            currentIndex = -1;
            viewIndexInput = 1;
            playbackStep = 0;
            session.reset();
        }

        ImGui::Separator();
        ImGui::Text("Prefetch");
        InputIntClamped("Level", &prefetchLevel, 1, 100000);
        if (ImGui::Button("Prefetch")) cache->prefetch(prefetchLevel);
        ImGui::SameLine();
        if (ImGui::Button("Take")) {
            // blocks until the worker finishes, or generates in place on a miss
            generated.push_back(cache->take(prefetchLevel));
            ensureIndex((int)generated.size() - 1);
            ++prefetchLevel;
            cache->prefetch(prefetchLevel);
        }
        ImGui::SameLine();
        if (cache->isReady(prefetchLevel)) ImGui::TextColored(ImVec4(0.6f, 1, 0.6f, 1), "ready");
        else if (cache->isPending(prefetchLevel)) ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "in flight");
        else ImGui::TextDisabled("idle");

        ImGui::Separator();
        ImGui::InputText("Save CSV", savePath, sizeof(savePath));
        if (ImGui::Button("Save")) {
            // append indices continuing from existing file if present
            auto rowsExisting = CsvIO::load(savePath);
            int startIdx = rowsExisting.empty() ? 0 : (rowsExisting.back().index + 1);
            std::vector<CsvRow> rows;
            for (size_t i = 0; i < generated.size(); ++i) {
                rows.push_back(CsvIO::encode(startIdx + (int)i, generated[i]));
            }
            if (CsvIO::save(savePath, rows, true)) setStatus("Saved " + std::to_string(rows.size()) + " level(s).");
            else setStatus(std::string("Could not write ") + savePath);
        }

        ImGui::InputText("Load CSV", loadPath, sizeof(loadPath));
        if (ImGui::Button("Load")) {
            generated.clear(); currentIndex = -1; viewIndexInput = 1;
            auto rows = CsvIO::load(loadPath);
            int rejected = 0;
            for (const auto& r : rows) {
                GenerationResult g;
                if (CsvIO::decode(r, opt.board, g)) generated.push_back(std::move(g));
                else ++rejected;
            }
            if (rejected > 0) setStatus(std::to_string(rejected) + " row(s) did not fit the current board.");
            if (!generated.empty()) ensureIndex(0);
        }

        ImGui::Separator();
        ImGui::Text("View by index");
        bool hasMaps = !generated.empty();
        int maxIndex = hasMaps ? (int)generated.size() : 1;
        viewIndexInput = std::clamp(viewIndexInput, 1, maxIndex);
        int inputValue = viewIndexInput;
        if (!hasMaps) ImGui::BeginDisabled();
        if (InputIntClamped("Map #", &inputValue, 1, maxIndex)) {
            viewIndexInput = inputValue;
            if (hasMaps) ensureIndex(viewIndexInput - 1);
        }
        if (!hasMaps) ImGui::EndDisabled();

        ImGui::End();
    }

    static ImU32 colorFor(CosmeticType t) {
        static const ImU32 table[kCosmeticTypeCount] = {
            IM_COL32(250,160,180,255), // pig
            IM_COL32(235,235,225,255), // sheep
            IM_COL32(200,150,90,255),  // dog
            IM_COL32(240,130,50,255),  // fox
            IM_COL32(120,120,130,255), // panda
        };
        return table[static_cast<int>(t)];
    }

    // Full (uninset) body of a piece as four corners, in screen space.
    static void bodyQuad(const Piece& p, ImVec2 origin, float scale, ImVec2 out[4]) {
        auto dims = pieceDimensions(p.direction, p.shortSide);
        Vec2 a = directionVector(p.direction), n{ -a.y, a.x };
        Vec2 c = p.center();
        float hl = dims.longSide * 0.5f, hw = dims.shortSide * 0.5f;
        const float sl[4] = { 1, 1, -1, -1 }, sw[4] = { 1, -1, -1, 1 };
        for (int k = 0; k < 4; ++k) {
            float x = c.x + a.x * hl * sl[k] + n.x * hw * sw[k];
            float y = c.y + a.y * hl * sl[k] + n.y * hw * sw[k];
            out[k] = ImVec2(origin.x + x * scale, origin.y + y * scale);
        }
    }

    static bool bodyContains(const Piece& p, float px, float py) {
        auto dims = pieceDimensions(p.direction, p.shortSide);
        Vec2 a = directionVector(p.direction), c = p.center();
        float dx = px - c.x, dy = py - c.y;
        return std::fabs(dx * a.x + dy * a.y) <= dims.longSide * 0.5f && std::fabs(-dx * a.y + dy * a.x) <= dims.shortSide * 0.5f;
    }

    // Prev / Next / Reset plus a direct step input for walking a removal sequence.
    static void stepControls(int& step, int maxStep) {
        ImGui::Text("Solution step: %d / %d", step, maxStep);
        ImGui::BeginDisabled(step <= 0);
        if (ImGui::Button("Prev")) --step;
        ImGui::EndDisabled();
        ImGui::SameLine();
        ImGui::BeginDisabled(step >= maxStep);
        if (ImGui::Button("Next")) ++step;
        ImGui::EndDisabled();
        ImGui::SameLine();
        if (ImGui::Button("Reset")) step = 0;
        int typed = step;
        if (InputIntClamped("Step", &typed, 0, maxStep)) step = typed;
    }

    void AppUI::drawViewer() {
        ImGui::Begin("Viewer");
        if (currentIndex < 0 || currentIndex >= (int)generated.size()) { ImGui::Text("No map selected"); ImGui::End(); return; }
        const auto& g = generated[currentIndex];

        ImGui::Text("Level %d  Pieces=%d  Diff=%.1f (%s)%s", g.level, g.total, g.difficultyScore, g.difficultyLabel.c_str(),
            g.solvable ? "" : "  UNSOLVABLE");

        // Board at a given step: either the solution playback or the live play session
        const Board* live = session ? &session->board() : nullptr;
        std::vector<char> gone(g.pieces.size(), 0);
        if (!live) {
            const auto& moves = g.removalOrder;
            int maxStep = (int)moves.size();
            playbackStep = std::clamp(playbackStep, 0, maxStep);
            if (moves.empty()) {
                ImGui::TextDisabled("No solution path recorded.");
            }
            else {
                ImGui::Separator();
                stepControls(playbackStep, maxStep);
                if (playbackStep > 0) ImGui::Text("Removed piece #%d", moves[playbackStep - 1]);
            }
            for (int i = 0; i < playbackStep; ++i) {
                int id = g.removalOrder[i];
                if (id >= 0 && id < (int)gone.size()) gone[id] = 1;
            }
            if (ImGui::Button("Play")) {
                session = std::make_unique<PlaySession>(g);
                lastTap.clear(); hintId = -1;
            }
        }
        else {
            ImGui::Separator();
            ImGui::Text("Play: %d left, %d removable", session->remaining(), session->removableCount());
            if (ImGui::Button("Hint")) {
                auto hint = session->hint();
                hintId = hint ? *hint : -1;
            }
            ImGui::SameLine();
            if (ImGui::Button("Stop")) { session.reset(); live = nullptr; }
            if (!lastTap.empty()) ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "%s", lastTap.c_str());
            if (session && session->cleared()) ImGui::TextColored(ImVec4(0.6f, 1, 0.6f, 1), "Cleared!");
            else if (session && session->deadlocked()) ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Deadlock");
        }

        ImVec2 avail = ImGui::GetContentRegionAvail();
        float scale = std::min(avail.x / g.screen.width, avail.y / g.screen.height);
        if (scale <= 0) { ImGui::End(); return; }
        ImDrawList* dl = ImGui::GetWindowDrawList();
        ImVec2 origin = ImGui::GetCursorScreenPos();
        ImGui::InvisibleButton("board", ImVec2(g.screen.width * scale, g.screen.height * scale));
        bool clicked = ImGui::IsItemClicked();

        auto toScreen = [&](float x, float y) { return ImVec2(origin.x + x * scale, origin.y + y * scale); };
        dl->AddRectFilled(toScreen(0, 0), toScreen(g.screen.width, g.screen.height), IM_COL32(30, 32, 40, 255));
        dl->AddRect(toScreen(g.boardRect.x, g.boardRect.y), toScreen(g.boardRect.right(), g.boardRect.bottom()), IM_COL32(90, 90, 110, 255));
        dl->AddRect(toScreen(g.safeRect.x, g.safeRect.y), toScreen(g.safeRect.right(), g.safeRect.bottom()), IM_COL32(60, 110, 60, 255));

        const auto& pieces = live ? live->pieces() : g.pieces;
        for (int i = 0; i < (int)pieces.size(); ++i) {
            const auto& pc = pieces[i];
            bool active = live ? live->isActive(i) : !gone[pc.id];
            if (!active) continue;
            ImVec2 q[4]; bodyQuad(pc, origin, scale, q);
            bool blocked = live ? isBlocked(*live, i) : false;
            ImU32 fill = colorFor(pc.type);
            dl->AddQuadFilled(q[0], q[1], q[2], q[3], fill);
            ImU32 edge = pc.id == hintId ? IM_COL32(80, 255, 120, 255) : (blocked ? IM_COL32(60, 60, 60, 255) : IM_COL32(20, 20, 20, 255));
            dl->AddQuad(q[0], q[1], q[2], q[3], edge, pc.id == hintId ? 3.0f : 1.0f);

            // facing arrow
            Vec2 a = directionVector(pc.direction), c = pc.center();
            float len = pc.shortSide * 1.1f;
            ImVec2 tail = toScreen(c.x - a.x * len * 0.5f, c.y - a.y * len * 0.5f);
            ImVec2 tip = toScreen(c.x + a.x * len * 0.5f, c.y + a.y * len * 0.5f);
            dl->AddLine(tail, tip, IM_COL32(20, 20, 20, 255), 2.0f);
            float hs = pc.shortSide * 0.3f;
            ImVec2 l = toScreen(c.x + a.x * (len * 0.5f - hs) - a.y * hs, c.y + a.y * (len * 0.5f - hs) + a.x * hs);
            ImVec2 r = toScreen(c.x + a.x * (len * 0.5f - hs) + a.y * hs, c.y + a.y * (len * 0.5f - hs) - a.x * hs);
            dl->AddTriangleFilled(tip, l, r, IM_COL32(20, 20, 20, 255));

            if (!live && scale * pc.shortSide >= 12.0f) {
                std::string depth = std::to_string(pc.depth);
                dl->AddText(toScreen(c.x + a.y * pc.shortSide * 0.4f, c.y - a.x * pc.shortSide * 0.4f), IM_COL32(255, 255, 255, 200), depth.c_str());
            }
        }

        if (live && clicked) {
            ImVec2 m = ImGui::GetMousePos();
            float bx = (m.x - origin.x) / scale, by = (m.y - origin.y) / scale;
            for (int i = 0; i < live->size(); ++i) {
                if (!live->isActive(i) || !bodyContains(live->piece(i), bx, by)) continue;
                int id = live->piece(i).id;
                TapOutcome t = session->tap(id);
                lastTap = "#" + std::to_string(id) + ": " + tapOutcomeName(t);
                hintId = -1;
                break;
            }
        }

        ImGui::End();
    }

    void AppUI::drawDiagnostics() {
        ImGui::Begin("Diagnostics");
        if (currentIndex < 0 || currentIndex >= (int)generated.size()) { ImGui::Text("No map selected"); ImGui::End(); return; }
        const auto& g = generated[currentIndex];
        const auto& d = g.diag;

        ImGui::Text("Seed %u  attempts %d  dead-ends %d  dropped %d  %.1f ms", d.seed, d.attempts, d.deadends, d.droppedPieces, d.elapsedMs);
        ImGui::Text("Layout: %s  fill %.2f  (%d lattice cells, target %d)", d.layoutProfile.c_str(), d.fillRate, d.latticeCells, d.placementTarget);
        ImGui::Text("Depth avg %.2f  max %d  removable %d (%.2f)", d.avgDepth, d.maxDepth, d.removableCount, d.removableRatio);
        const auto& ds = d.directions;
        ImGui::Text("Directions U/R/D/L: %d %d %d %d", ds.counts[0], ds.counts[1], ds.counts[2], ds.counts[3]);
        ImGui::Text("Ratio global %.2f  local %.2f  lane %.2f", ds.maxRatio, ds.maxLocalRatio, ds.maxLaneRatio);
        ImGui::Text("Within band: %s", d.withinBand ? "yes" : "no");
        if (d.has(GenIssue::BoardTooSmall)) ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Board too small");
        if (d.has(GenIssue::PlacementShortfall)) ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "Placement shortfall");
        if (d.has(GenIssue::AssignmentDeadend)) ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "Assignment dead-end seen");
        if (d.has(GenIssue::DifficultyOutOfBand)) ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "Difficulty out of band");

        ImGui::Separator();
        Board board(g.pieces, g.screen);
        auto graph = DependencyGraph::build(board);
        auto report = graph.validateSolvability();
        ImGui::Text("Solvability: %s", solvabilityReasonName(report.reason));
        ImGui::Text("Branch factor %.2f  tolerance %.2f  graph difficulty %.1f", graph.avgBranchFactor(), graph.toleranceRate(), graph.difficulty());
        auto dist = graph.depthDistribution();
        std::string line = "Depth histogram:";
        for (size_t k = 0; k < dist.size(); ++k) line += " " + std::to_string(dist[k]);
        ImGui::TextWrapped("%s", line.c_str());

        if (ImGui::Button("Estimate deadlock rate")) {
            RNG rng(d.seed ^ 0x9E3779B9u);
            deadlockEstimate = estimateDeadlockProbability(board, rng, 50);
        }
        if (deadlockEstimate >= 0) {
            ImGui::SameLine();
            ImGui::Text("%.0f%% of random playouts jam", deadlockEstimate * 100.0);
        }

        ImGui::End();
    }

    int AppUI::run() {
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            spdlog::critical("SDL_Init failed: {}", SDL_GetError());
            return 1;
        }
        SDL_Window* window = SDL_CreateWindow("Lane Puzzle Map Tool", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1400, 900, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
        if (!window) {
            spdlog::critical("SDL_CreateWindow failed: {}", SDL_GetError());
            SDL_Quit();
            return 1;
        }
        SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
            spdlog::critical("SDL_CreateRenderer failed: {}", SDL_GetError());
            SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGui::StyleColorsDark();

        ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
        ImGui_ImplSDLRenderer2_Init(renderer);
        spdlog::info("map tool ready");

        bool running = true; SDL_Event e;
        while (running) {
            while (SDL_PollEvent(&e)) {
                ImGui_ImplSDL2_ProcessEvent(&e);
                if (e.type == SDL_QUIT) running = false;
            }
            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            drawTopBar();
            drawViewer();
            drawDiagnostics();

            ImGui::Render();
            SDL_SetRenderDrawColor(renderer, 20, 20, 24, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);
        }

        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

} // namespace lp
