#pragma once

#include "executor.h"

namespace strata {

// Cancellation flag raised by SIGINT/SIGTERM
cancellation &termination_cancellation();

// First SIGINT/SIGTERM requests cancellation: no new provider calls start, in-flight
// ones finish and are recorded. A second signal exits immediately with 128 + signal.
void termination_handler_install();

}  // namespace strata
