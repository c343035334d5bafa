#pragma once

// Process-wide diagnostic log. Silent until a stream or log file is set.

#include <ostream>
#include <string>

namespace nscoder {

// Routes log lines to os; nullptr disables logging.
void set_log_stream(std::ostream* os);

// Opens <prefix>.log and routes log lines to it.
void set_log_prefix(const std::string& prefix);

auto log_enabled() -> bool;

void log(const std::string& message);

} // namespace nscoder
