#pragma once

#include <ostream>
#include <string>

namespace logging {

// All diagnostics go to one stream (std::cerr unless redirected).
// Lines look like "[Component] message".
void set_sink(std::ostream* out);
std::ostream& sink();

void info(const std::string& component, const std::string& msg);
void warn(const std::string& component, const std::string& msg);

}  // namespace logging
