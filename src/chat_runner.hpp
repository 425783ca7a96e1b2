#pragma once

#include "conversation.hpp"
#include "orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iosfwd>
#include <string>
#include <vector>

namespace chatbridge {

class Logger;

// Set from signal handlers; checked by the run loops between turns.
void RequestInterrupt();
bool InterruptRequested();
void ClearInterrupt();

bool IsQuitCommand(const std::string& line);

// Local time as "YYYY-mm-ddTHH:MM:SS.ffffff".
std::string IsoTimestampNow();

nlohmann::json BuildStdioResponse(const std::string& response,
                                  const std::vector<std::string>& tools_used,
                                  const std::vector<std::string>& tools_available,
                                  const std::string& timestamp);

nlohmann::json BuildStdioError(const std::string& error,
                               const std::string& error_type,
                               const std::vector<std::string>& tools_available,
                               const std::string& timestamp);

std::string ExceptionTypeName(const std::exception& e);

// Console loop: "You: " prompt, "Assistant: " replies, quit/exit/bye ends the session.
// Returns the process exit code.
int RunInteractive(ChatOrchestrator& orchestrator, const ChatSession& session, std::istream& in, std::ostream& out,
                   Logger* log);

// One user turn per non-empty input line, one JSON document per turn on `out`.
// Returns the process exit code once input ends.
int RunStdio(ChatOrchestrator& orchestrator, const ChatSession& session, std::istream& in, std::ostream& out,
             Logger* log);

}  // namespace chatbridge
