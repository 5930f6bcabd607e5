#pragma once

// Progression module umbrella header

#include <narrative/progression/critical_reward.hpp>
#include <narrative/progression/reward_store.hpp>
#include <narrative/progression/retry_policy.hpp>
#include <narrative/progression/progression_guard.hpp>
#include <narrative/progression/dialogue_session.hpp>
