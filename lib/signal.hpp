#pragma once

#include <csignal>

#include <signal.h>


/**
 *  @brief C System call wrapper
 *
 *  @details Wraps the sigaction system call in a namespace along with
 *  the flags used in catching system interrupts. Handlers are installed
 *  without SA_RESTART so blocking reads return early on interrupt.
 */
namespace os
{

namespace signal
{

// Singal type compatible with system call
using signal_t = int;

// Exit flag type safe to write from a handler
using flag_t = volatile std::sig_atomic_t;

using handler_t = void (*)(signal_t);

constexpr signal_t SIG_DEF = 0;
constexpr signal_t SIG_EXT = 1;

constexpr signal_t SIG_INT  = SIGINT;
constexpr signal_t SIG_TERM = SIGTERM;

/**
 *  @brief Install interrupt handler
 *
 *  @param interrupt: signal to catch
 *  @param handler:   routine run on delivery
 *
 *  @return whether handler was installed
 */
inline
bool
install
(
    signal_t  interrupt,
    handler_t handler
) noexcept
{
    struct ::sigaction action {};
    action.sa_handler = handler;
    action.sa_flags   = 0;
    sigemptyset(&action.sa_mask);

    return ::sigaction(interrupt, &action, nullptr) == 0;
}

} // signal namespace

} // os namespace
