#include "anchorpatch/core/disambiguation.hpp"

namespace anchorpatch {

auto build_disambiguation_request(const Document& document, const Hunk& hunk,
                                  size_t hunk_number,
                                  const std::vector<MatchCandidate>& candidates,
                                  size_t context_lines) -> DisambiguationRequest {
    DisambiguationRequest request{.hunk_number = hunk_number,
                                  .kind = hunk_kind(hunk),
                                  .anchor = anchor_lines(hunk),
                                  .candidates = candidates,
                                  .windows = {}};

    request.windows.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        request.windows.push_back(build_context_window(document, candidate, context_lines));
    }

    return request;
}

auto choice_display_name(const Choice& choice) -> std::string {
    switch (choice.action) {
    case ChoiceAction::SELECT:
        return "candidate " + std::to_string(choice.index + 1);
    case ChoiceAction::SKIP:
        return "skip";
    case ChoiceAction::CANCEL:
        return "cancel";
    }
    return "unknown";
}

auto policy_choice(AmbiguityPolicy policy) -> Choice {
    switch (policy) {
    case AmbiguityPolicy::FIRST:
        return Choice{.action = ChoiceAction::SELECT, .index = 0};
    case AmbiguityPolicy::CANCEL:
        return Choice{.action = ChoiceAction::CANCEL, .index = 0};
    case AmbiguityPolicy::SKIP:
        break;
    }
    return Choice{.action = ChoiceAction::SKIP, .index = 0};
}

ScriptedDisambiguator::ScriptedDisambiguator(AmbiguityPolicy policy, std::vector<Choice> script)
    : policy_(policy), script_(script.begin(), script.end()) {}

auto ScriptedDisambiguator::resolve(const DisambiguationRequest& request) -> Choice {
    requests_.push_back(request);

    if (script_.empty()) {
        return policy_choice(policy_);
    }

    auto choice = script_.front();
    script_.pop_front();
    return choice;
}

} // namespace anchorpatch
