#include "common/Log.hpp"

#include <iostream>
#include <mutex>

namespace logging {

static std::ostream* g_sink = nullptr;
static std::mutex g_mu;

void set_sink(std::ostream* out) {
    std::lock_guard<std::mutex> lock(g_mu);
    g_sink = out;
}

std::ostream& sink() {
    return g_sink ? *g_sink : std::cerr;
}

static void write_line(const char* level, const std::string& component, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_mu);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << "[" << component << "] " << level << msg << "\n";
}

void info(const std::string& component, const std::string& msg) {
    write_line("", component, msg);
}

void warn(const std::string& component, const std::string& msg) {
    write_line("warning: ", component, msg);
}

}  // namespace logging
