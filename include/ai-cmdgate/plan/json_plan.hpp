#pragma once
#include <string>
#include <vector>

namespace cmdgate::plan {

struct ParsedStep { std::string id; std::string description; std::string command; };
struct ParsedPlan { std::string request; std::vector<ParsedStep> steps; bool valid=false; };

// Parse the minimal JSON an AI planner emits:
//   {"request": "...", "steps": [{"id": "s1", "description": "...", "command": "..."}]}
// Text around the outer braces (including ``` fences) is ignored. Steps
// without a command are dropped; missing ids become s1, s2, ...
ParsedPlan parse_plan_json(const std::string& json);

// Remove a surrounding ```/```json/```bash fence, if present.
std::string strip_code_fence(const std::string& text);

}
