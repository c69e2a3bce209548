#include <layout_host/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace layout_host {

namespace {

const char* const logger_name = "slide_grid_session";

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> session_logger() {
    auto& logger = logger_slot();
    if (!logger) logger = spdlog::default_logger();
    return logger;
}

bool init_file_logging(const std::string& path) {
    try {
        const std::filesystem::path log_file(path);
        if (log_file.has_parent_path()) std::filesystem::create_directories(log_file.parent_path());
        spdlog::drop(logger_name);
        auto logger = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Session logger initialized. file={}", log_file.string());
        logger_slot() = logger;
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        session_logger()->warn("cannot open session log '{}': {}", path, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        session_logger()->warn("cannot create log directory for '{}': {}", path, e.what());
    }
    return false;
}

} // namespace layout_host
