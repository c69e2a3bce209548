#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace layout_host {

// Logger used by editor sessions. The default spdlog logger until init_file_logging succeeds.
std::shared_ptr<spdlog::logger> session_logger();

// Sends session logs to `path`, truncating it. On failure the current logger is kept
// and false is returned.
bool init_file_logging(const std::string& path);

} // namespace layout_host
