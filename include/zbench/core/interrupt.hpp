#pragma once

namespace zbench {

// Installs SIGINT/SIGTERM handlers that only raise a flag. Long-running
// loops poll interrupt_requested() between units of work.
bool install_interrupt_handlers() noexcept;

bool interrupt_requested() noexcept;

void clear_interrupt() noexcept;

}  // namespace zbench
