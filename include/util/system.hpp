#pragma once

/**
 * Process-level utilities: graceful shutdown on SIGINT/SIGTERM.
 */

#include "../engine/cancellation.hpp"

#include <csignal>
#include <unistd.h>

namespace intraday {
namespace util {

namespace detail {
inline engine::CancellationToken* g_shutdown_token = nullptr;
} // namespace detail

/**
 * Graceful shutdown signal handler.
 *
 * Requests cancellation on the installed token. Only async-signal-safe
 * calls: a lock-free atomic exchange and write(2).
 */
inline void graceful_shutdown_handler(int /*sig*/) {
    if (detail::g_shutdown_token && detail::g_shutdown_token->request()) {
        static const char msg[] = "\n[SHUTDOWN] Stop requested, closing open position...\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * @param token Cancellation token to trigger on signal
 */
inline void install_shutdown_handler(engine::CancellationToken& token) {
    detail::g_shutdown_token = &token;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

} // namespace util
} // namespace intraday
