#include <narrative/dialogue/view_state.hpp>

namespace narrative::dialogue {

ViewState make_view_state(const DialogueStateMachine& machine) {
    ViewState view;
    const DialogueState* state = machine.current_state();
    if (!machine.is_active() || !state) {
        return view;
    }

    view.id = state->id;
    view.text = machine.current_text();
    view.is_conclusion = state->is_conclusion;
    view.is_critical_path = state->is_critical_path;
    view.showing_response = machine.is_showing_response();
    view.in_backstory = machine.is_in_backstory();
    view.terminal = machine.is_terminal();

    for (const DialogueOption* option : machine.available_options()) {
        view.options.push_back({option->id, option->text});
    }
    return view;
}

} // namespace narrative::dialogue
