#pragma once

// Umbrella header for narrative::economy module
#include <narrative/economy/resource.hpp>
#include <narrative/economy/strategic_action.hpp>
#include <narrative/economy/resource_economy.hpp>
