#pragma once

// Dialogue module umbrella header

#include <narrative/dialogue/dialogue_context.hpp>
#include <narrative/dialogue/dialogue_state.hpp>
#include <narrative/dialogue/dialogue_graph.hpp>
#include <narrative/dialogue/dialogue_loader.hpp>
#include <narrative/dialogue/dialogue_state_machine.hpp>
#include <narrative/dialogue/view_state.hpp>
