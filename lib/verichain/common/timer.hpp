#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <chrono>
#include <string>
#include "logger.hpp"

namespace verichain {
    // Logs the wall-clock duration of a scope once it ends or when stop is called explicitly.
    struct timer {
        explicit timer(const std::string_view title, const logger::level lev=logger::level::debug):
            _title { title },
            _level { lev }
        {
        }

        ~timer()
        {
            stop();
        }

        timer(const timer &) =delete;
        timer &operator=(const timer &) =delete;

        double stop(const bool report=true)
        {
            if (!_stopped) {
                _stopped = true;
                _duration = duration();
                if (report)
                    logger::log(_level, "timer {} took {:0.3f} sec", _title, _duration);
            }
            return _duration;
        }

        [[nodiscard]] double duration() const
        {
            if (_stopped)
                return _duration;
            return std::chrono::duration<double> { std::chrono::steady_clock::now() - _start }.count();
        }
    private:
        std::string _title;
        logger::level _level;
        std::chrono::time_point<std::chrono::steady_clock> _start { std::chrono::steady_clock::now() };
        double _duration = 0.0;
        bool _stopped = false;
    };
}
