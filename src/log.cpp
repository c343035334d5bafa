// log.cpp - diagnostic log sink and invariant failure reporting

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include "nscoder/error.hpp"
#include "nscoder/log.hpp"

namespace nscoder {

namespace {

std::optional<std::ofstream> log_file;
std::ostream* log_stream = nullptr;

} // namespace

void set_log_stream(std::ostream* os) {
    log_file.reset();
    log_stream = os;
}

void set_log_prefix(const std::string& prefix) {
    auto filename = prefix + ".log";
    log_stream = nullptr;
    log_file.emplace(filename);
    if (!*log_file) {
        log_file.reset();
        throw std::runtime_error("cannot open log file: " + filename);
    }
    log_stream = &*log_file;
}

auto log_enabled() -> bool {
    return log_stream != nullptr;
}

void log(const std::string& message) {
    if (log_stream) {
        *log_stream << "nscoder: " << message << "\n";
        log_stream->flush();
    }
}

namespace detail {

void invariant_failure(const char* what) {
    std::cerr << "nscoder: internal invariant violated: " << what << "\n";
    std::abort();
}

} // namespace detail

} // namespace nscoder
