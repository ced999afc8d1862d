#pragma once

#include <conduit/core/types.h>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::exec {

/**
 * Actionable summary for an assistant failure, derived only from its message text.
 * Classification is advisory; callers never branch on it.
 */
struct FailureHint {
    ErrorCode code{ErrorCode::RuntimeFailure};
    std::string summary;
    std::vector<std::string> solutions;
    bool classified{false};
};

namespace detail {

struct HintRule {
    std::array<std::string_view, 3> patterns;
    ErrorCode code;
    std::string_view summary;
    std::array<std::string_view, 2> solutions;
};

// First match wins.
inline constexpr std::array<HintRule, 6> kHintRules{{
    {{"ANTHROPIC_API_KEY", {}, {}},
     ErrorCode::ConfigurationFailure,
     "Assistant API key is not configured.",
     {"Set your API key with: export ANTHROPIC_API_KEY='your-key'",
      "Or log in with 'claude login' to use a subscription without an API key"}},
    {{"rate limit", {}, {}},
     ErrorCode::ConfigurationFailure,
     "Assistant API rate limit exceeded.",
     {"Wait a few minutes before trying again", "Check your usage at anthropic.com"}},
    {{"authentication", "401", {}},
     ErrorCode::ConfigurationFailure,
     "Assistant API authentication failed.",
     {"Verify your API key is correct", "Check if your API key has expired"}},
    {{"quota", {}, {}},
     ErrorCode::ConfigurationFailure,
     "Assistant API quota exceeded.",
     {"Check your usage limits at anthropic.com", "Upgrade your plan if needed"}},
    {{"Invalid request", {}, {}},
     ErrorCode::ConfigurationFailure,
     "Invalid request sent to the assistant.",
     {"Check if the message format is correct", "Try a simpler message to test"}},
    {{"No such file or directory", "not found", "ENOENT"},
     ErrorCode::LaunchFailure,
     "Assistant executable could not be started.",
     {"Install the CLI with: npm install -g @anthropic-ai/claude-code",
      "Or set assistant.executable in the config file to its full path"}},
}};

inline constexpr std::size_t kDebugInfoLimit = 300;

} // namespace detail

inline FailureHint classifyFailure(std::string_view message) {
    for (const auto& rule : detail::kHintRules) {
        for (auto pattern : rule.patterns) {
            if (pattern.empty() || message.find(pattern) == std::string_view::npos)
                continue;
            FailureHint hint;
            hint.code = rule.code;
            hint.summary = std::string(rule.summary);
            for (auto s : rule.solutions)
                hint.solutions.emplace_back(s);
            hint.classified = true;
            return hint;
        }
    }
    FailureHint hint;
    hint.summary = "Assistant process exited unexpectedly.";
    hint.solutions = {"Run 'claude --version' to check the assistant is working",
                      "For subscription users: ensure you're logged in with 'claude login'",
                      "For API users: ensure ANTHROPIC_API_KEY is set",
                      "Check the backend logs for more details"};
    return hint;
}

/**
 * Human readable failure text:
 *
 *   <summary>
 *
 *   Possible solutions:
 *   • ...
 *
 *   Debug info: <first 300 chars of message>
 */
inline std::string formatFailure(std::string_view message) {
    const auto hint = classifyFailure(message);
    std::string out = hint.summary;
    out += "\n\nPossible solutions:";
    for (const auto& s : hint.solutions) {
        out += "\n• ";
        out += s;
    }
    out += "\n\nDebug info: ";
    out += message.substr(0, detail::kDebugInfoLimit);
    return out;
}

} // namespace conduit::exec
