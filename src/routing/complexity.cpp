#include "switchboard/routing/complexity.hpp"

#include "switchboard/common/fs.hpp"

#include <algorithm>
#include <array>

namespace switchboard::routing {

namespace {

constexpr std::array<const char *, 6> REASONING_KEYWORDS = {
    "analyze", "synthesize", "evaluate", "compare", "reasoning", "step by step"};
constexpr std::array<const char *, 4> CODE_KEYWORDS = {"code", "implement", "function",
                                                       "algorithm"};

template <std::size_t N>
bool mentions_any(const std::string &lowered, const std::array<const char *, N> &keywords) {
  return std::any_of(keywords.begin(), keywords.end(), [&](const char *keyword) {
    return lowered.find(keyword) != std::string::npos;
  });
}

} // namespace

double complexity_score(const backends::CompletionRequest &request) {
  // Accumulate in hundredths so thresholds compare exactly.
  int points = 0;

  std::size_t characters = 0;
  std::string system_text;
  for (const auto &message : request.messages) {
    characters += message.text.size();
    if (message.role == backends::MessageRole::System) {
      system_text += common::to_lower(message.text);
      system_text += '\n';
    }
  }

  if (characters > 8000) {
    points += 30;
  } else if (characters > 4000) {
    points += 20;
  } else if (characters > 2000) {
    points += 10;
  }

  const std::size_t count = request.messages.size();
  if (count > 10) {
    points += 20;
  } else if (count > 5) {
    points += 10;
  }

  if (!system_text.empty()) {
    if (mentions_any(system_text, REASONING_KEYWORDS)) {
      points += 20;
    }
    if (mentions_any(system_text, CODE_KEYWORDS)) {
      points += 15;
    }
  }

  const std::uint32_t max_tokens = request.max_tokens.value_or(0);
  if (max_tokens > 4000) {
    points += 15;
  } else if (max_tokens > 2000) {
    points += 10;
  }

  return std::min(points, 100) / 100.0;
}

} // namespace switchboard::routing
