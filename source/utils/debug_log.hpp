#ifndef MCPBRIDGE_DEBUG_LOG_HPP
#define MCPBRIDGE_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if MCPBRIDGE_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [mcpbridge] prefix only when is_debug_enabled().
void log(const std::string &message);

// Always written to stderr with [mcpbridge] prefix.
void info(const std::string &message);
void error(const std::string &message);

} // namespace debug_log

#endif // MCPBRIDGE_DEBUG_LOG_HPP
