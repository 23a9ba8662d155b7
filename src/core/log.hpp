#pragma once

#include <string>
#include <core/types.hpp>

// Path of the debug log: <temp_dir>/portscope_debug.log
std::string portscope_log_path();

// Append a "[HH:MM:SS.mmm] msg" line to the debug log.
void portscope_log(const std::string& msg);

// Sink that forwards to portscope_log (default for injected loggers).
StatusCallback default_log_sink();

// Sink that writes to the debug log and echoes to the terminal.
StatusCallback verbose_log_sink();
