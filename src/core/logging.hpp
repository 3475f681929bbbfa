#pragma once

#include <string>

/// Install the process-wide spdlog logger. An empty or unwritable `file`
/// gets a null sink so nothing leaks onto the interactive terminal.
/// Returns false when the file could not be opened.
bool init_logging(const std::string& file, const std::string& level);
