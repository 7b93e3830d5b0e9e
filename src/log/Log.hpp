// ========================= src/log/Log.hpp =========================
#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace lp {
namespace logsys {

    // Installs the "lanepuzzle" logger as spdlog's default: colored console, plus a rotating
    // file (1 MB x 4) when filePath is not empty.
    void init(spdlog::level::level_enum level = spdlog::level::info, const std::string& filePath = "");
    std::shared_ptr<spdlog::logger> get();

} // namespace logsys
} // namespace lp
