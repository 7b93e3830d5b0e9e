// ========================= src/log/Log.cpp =========================
#include "Log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

namespace lp {
namespace logsys {

    static std::shared_ptr<spdlog::logger> g_logger;

    void init(spdlog::level::level_enum level, const std::string& filePath) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!filePath.empty()) {
            std::error_code ec;
            auto dir = std::filesystem::path(filePath).parent_path();
            if (!dir.empty()) std::filesystem::create_directories(dir, ec);
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filePath, 1 << 20, 4));
        }
        g_logger = std::make_shared<spdlog::logger>("lanepuzzle", sinks.begin(), sinks.end());
        g_logger->set_level(level);
        spdlog::set_default_logger(g_logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
        spdlog::flush_on(spdlog::level::warn);
        spdlog::info("Logging started");
    }

    std::shared_ptr<spdlog::logger> get() { return g_logger ? g_logger : spdlog::default_logger(); }

} // namespace logsys
} // namespace lp
