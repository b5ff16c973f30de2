#pragma once

#include <string>
#include <vector>

namespace manor {

enum class issue_severity_t { warning, error };

struct content_issue_t {
  issue_severity_t severity = issue_severity_t::error;
  std::string subject; // id of the room, item or fixture at fault
  std::string message;
};

/**
 * @brief Cross-checks the loaded registries: one start room, a goal room,
 * references from rooms and fixtures to items, fixtures and rooms that exist.
 * A session can start only when no error is reported.
 */
auto check_content() -> std::vector<content_issue_t>;

auto count_errors(const std::vector<content_issue_t> &issues) -> int;

} // namespace manor
