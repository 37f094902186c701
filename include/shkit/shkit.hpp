#pragma once

/**
 * @file shkit.hpp
 * @brief Convenience header pulling in the whole shkit library
 *
 * Validation:   validation.hpp, diagnostics.hpp, call_stack.hpp
 * Scaffolding:  test_root.hpp, stubs.hpp, runner.hpp, output.hpp
 * Support:      config.hpp, logging.hpp, platform.hpp, path_utils.hpp
 */

#include "shkit/call_stack.hpp"
#include "shkit/config.hpp"
#include "shkit/diagnostics.hpp"
#include "shkit/logging.hpp"
#include "shkit/output.hpp"
#include "shkit/path_utils.hpp"
#include "shkit/platform.hpp"
#include "shkit/runner.hpp"
#include "shkit/stubs.hpp"
#include "shkit/test_root.hpp"
#include "shkit/validation.hpp"
