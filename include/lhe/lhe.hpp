#pragma once

/// @file lhe.hpp
/// @brief Umbrella header for the layered health engine.

#include "lhe/version.hpp"
#include "lhe/core/result.hpp"
#include "lhe/foundation/error_code.hpp"
#include "lhe/foundation/game_error.hpp"
#include "lhe/foundation/game_result.hpp"
#include "lhe/foundation/signal.hpp"
#include "lhe/health/classification.hpp"
#include "lhe/health/damage_info.hpp"
#include "lhe/health/damageable.hpp"
#include "lhe/health/health_bar_segment.hpp"
#include "lhe/health/reaction_rule_builder.hpp"
#include "lhe/health/reaction_table.hpp"
