#pragma once

#include <narrative/dialogue/dialogue_state_machine.hpp>
#include <string>
#include <vector>

namespace narrative::dialogue {

// ============================================================================
// ViewState - read-only snapshot for rendering surfaces
// ============================================================================

struct ViewOption {
    std::string id;
    std::string text;
};

struct ViewState {
    std::string id;
    std::string text;                   // Response text while a response is shown
    std::vector<ViewOption> options;    // Only options whose condition holds
    bool is_conclusion = false;
    bool is_critical_path = false;
    bool showing_response = false;
    bool in_backstory = false;
    bool terminal = false;
};

// Empty view when no session is active
ViewState make_view_state(const DialogueStateMachine& machine);

} // namespace narrative::dialogue
