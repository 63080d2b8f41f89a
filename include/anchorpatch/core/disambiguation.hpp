#pragma once

#include "anchorpatch/core/anchor_locator.hpp"
#include "anchorpatch/core/hunk.hpp"
#include "anchorpatch/interfaces.hpp"
#include <deque>
#include <string>
#include <vector>

namespace anchorpatch {

enum class ChoiceAction {
    SELECT,  // Apply at candidates[index]
    SKIP,    // Leave this hunk out, keep going
    CANCEL   // Stop the whole run, keep what was applied
};

struct Choice {
    ChoiceAction action = ChoiceAction::SKIP;
    size_t index{};

    auto operator==(const Choice& other) const -> bool = default;
};

// Everything a chooser needs to pick among several anchor matches
struct DisambiguationRequest {
    size_t hunk_number{};
    HunkKind kind = HunkKind::EXPLICIT_ANCHOR;
    std::vector<std::string> anchor;
    std::vector<MatchCandidate> candidates;
    std::vector<ContextWindow> windows;   // One per candidate, same order
};

auto build_disambiguation_request(const Document& document, const Hunk& hunk,
                                  size_t hunk_number,
                                  const std::vector<MatchCandidate>& candidates,
                                  size_t context_lines) -> DisambiguationRequest;

auto choice_display_name(const Choice& choice) -> std::string;

// Batch policy when nobody is there to ask
enum class AmbiguityPolicy {
    SKIP,
    FIRST,
    CANCEL
};

auto policy_choice(AmbiguityPolicy policy) -> Choice;

// Deterministic resolver: answers from a script, then from a fixed policy. Used by batch
// mode and by tests in place of a terminal.
class ScriptedDisambiguator : public IDisambiguator {
public:
    explicit ScriptedDisambiguator(AmbiguityPolicy policy = AmbiguityPolicy::SKIP,
                                   std::vector<Choice> script = {});

    auto resolve(const DisambiguationRequest& request) -> Choice override;

    auto requests() const -> const std::vector<DisambiguationRequest>& { return requests_; }

private:
    AmbiguityPolicy policy_;
    std::deque<Choice> script_;
    std::vector<DisambiguationRequest> requests_;
};

} // namespace anchorpatch
