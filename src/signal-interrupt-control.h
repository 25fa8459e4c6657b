// Copyright Cartesi and individual authors (see AUTHORS)
// SPDX-License-Identifier: LGPL-3.0-or-later
//
// This program is free software: you can redistribute it and/or modify it under
// the terms of the GNU Lesser General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT ANY
// WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
// PARTICULAR PURPOSE. See the GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License along
// with this program (see COPYING). If not, see <https://www.gnu.org/licenses/>.
//

#ifndef SIGNAL_INTERRUPT_CONTROL_H
#define SIGNAL_INTERRUPT_CONTROL_H

/// \file
/// \brief Interrupt control for hosted builds, where asynchronous signals play the role of interrupts.

#include <csignal>
#include <system_error>

#include <pthread.h>

#include "i-interrupt-control.h"
#include "slog.h"

namespace amoemu {

class signal_interrupt_control;

template <>
struct i_interrupt_control_saved_state<signal_interrupt_control> {
    using type = sigset_t; ///< Signal mask of the calling thread before blocking
};

/// \brief Blocks every blockable signal for the calling thread
/// \details A signal handler running the trap dispatcher cannot interrupt an emulation while the mask
/// is in effect. SIGKILL and SIGSTOP cannot be blocked, which mirrors non-maskable interrupts.
class signal_interrupt_control : public i_interrupt_control<signal_interrupt_control> {
    // Allow interface to access private methods
    friend i_interrupt_control<signal_interrupt_control>;

    static sigset_t do_disable_interrupts() {
        sigset_t all{};
        sigset_t prev{};
        sigfillset(&all);
        const int error = pthread_sigmask(SIG_BLOCK, &all, &prev);
        if (error != 0) {
            throw std::system_error{error, std::generic_category(), "unable to block signals"};
        }
        return prev;
    }

    static void do_restore_interrupts(const sigset_t &prev) noexcept {
        const int error = pthread_sigmask(SIG_SETMASK, &prev, nullptr);
        if (error != 0) {
            SLOG(error) << "unable to restore signal mask: " << std::generic_category().message(error);
        }
    }
};

} // namespace amoemu

#endif
