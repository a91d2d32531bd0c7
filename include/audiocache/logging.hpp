#pragma once

#include <string>

namespace audiocache {

// Installs a colored stdout logger as the spdlog default. `level` is an
// spdlog level name ("debug", "info", "warn", ...); unknown names mean info.
// A non-empty `log_file` adds a rotating file sink.
void InitLogging(const std::string& level, const std::string& log_file = "");

} // namespace audiocache
