#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

bool init_logging(const std::string& file, const std::string& level) {
    std::shared_ptr<spdlog::logger> logger;
    bool opened = false;

    if (!file.empty()) {
        try {
            std::error_code ec;
            auto parent = fs::path(file).parent_path();
            if (!parent.empty()) fs::create_directories(parent, ec);
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file);
            logger = std::make_shared<spdlog::logger>("phantom-manager", sink);
            opened = true;
        } catch (const spdlog::spdlog_ex&) {
            logger.reset();
        }
    }

    if (!logger) {
        logger = std::make_shared<spdlog::logger>(
            "phantom-manager", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    logger->set_level(spdlog::level::from_str(level));
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (opened) {
        spdlog::debug("Logging to {}", file);
    }
    return opened || file.empty();
}
