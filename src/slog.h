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

#ifndef SLOG_H
#define SLOG_H

/// \file
/// \brief Minimal leveled logging to an ostream, one line per statement

#include <iostream>
#include <ostream>
#include <utility>

namespace slog {

struct autoendl {
    autoendl(std::ostream &out) : _out(out), _flags(out.flags()) {}

    template <class Rhs>
    autoendl &operator<<(Rhs &&rhs) {
        _out << std::forward<Rhs>(rhs);
        return *this;
    }

    autoendl &operator<<(std::ostream &(*manip)(std::ostream &) ) {
        manip(_out);
        return *this;
    }

    ~autoendl() {
        // Formatting set within a line does not outlive it
        _out.flags(_flags);
        _out << std::endl;
    }

    autoendl(const autoendl &) = default;
    autoendl(autoendl &&) = default;
    autoendl &operator=(const autoendl &) = delete;
    autoendl &operator=(autoendl &&) = delete;

private:
    std::ostream &_out; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::ios_base::fmtflags _flags;
};

enum class level_operation {
    get, ///> Get current level
    set  ///> Set current level
};

enum class severity_level { trace, debug, info, warning, error, fatal };

/// \brief Level used until someone changes it
constexpr severity_level default_log_level = severity_level::info;

/// \brief Gets or sets the process-wide log level
/// \param operation Whether to get or set the level
/// \param new_level Level to set (ignored on get)
/// \returns Level in effect before the call
severity_level log_level(level_operation operation, severity_level new_level = default_log_level);

const char *to_string(severity_level level);

/// \brief Converts a level name into a severity_level
/// \details Throws std::domain_error on unknown names.
severity_level from_string(const char *name);

/// \brief Sets a log level for the lifetime of the object, then puts back the previous one
class scoped_log_level {
public:
    explicit scoped_log_level(severity_level level) : m_saved(log_level(level_operation::set, level)) {}
    ~scoped_log_level() {
        log_level(level_operation::set, m_saved);
    }
    scoped_log_level(const scoped_log_level &) = delete;
    scoped_log_level &operator=(const scoped_log_level &) = delete;
    scoped_log_level(scoped_log_level &&) = delete;
    scoped_log_level &operator=(scoped_log_level &&) = delete;

private:
    severity_level m_saved;
};

struct level_prefix {
    severity_level level;
};

static inline std::ostream &operator<<(std::ostream &out, level_prefix p) {
    return out << "[amoemu] " << to_string(p.level) << ": ";
}

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#ifndef SLOG_PREFIX
#define SLOG_PREFIX level_prefix
#endif

#ifndef SLOG_OSTREAM
#define SLOG_OSTREAM std::clog
#endif

#ifndef SLOG_DISABLE
#define SLOG_DISABLE (false)
#endif

#define SLOG(level)                                                                                                    \
    if (SLOG_DISABLE || slog::severity_level::level < slog::log_level(slog::level_operation::get)) {                   \
    } else                                                                                                             \
        slog::autoendl(SLOG_OSTREAM) << slog::SLOG_PREFIX {                                                            \
            slog::severity_level::level                                                                                \
        }
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace slog

#endif
