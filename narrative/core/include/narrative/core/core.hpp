#pragma once

// Umbrella header for narrative::core module
#include <narrative/core/log.hpp>
#include <narrative/core/errors.hpp>
#include <narrative/core/events.hpp>
#include <narrative/core/event_bus.hpp>
#include <narrative/core/filesystem.hpp>
#include <narrative/core/scheduler.hpp>
#include <narrative/core/settings.hpp>
