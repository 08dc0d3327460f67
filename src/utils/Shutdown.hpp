#pragma once

#include <chrono>

namespace rf::runtime
{

void request_shutdown() noexcept;
bool should_shutdown() noexcept;

// Sleeps in short slices until shutdown is requested or the timeout ends.
// Returns should_shutdown().
bool wait_for_shutdown(std::chrono::milliseconds timeout) noexcept;

} // namespace rf::runtime
