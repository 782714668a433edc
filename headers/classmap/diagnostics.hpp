//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CLASSMAP_DIAGNOSTICS_HPP
#define CLASSMAP_DIAGNOSTICS_HPP

/**
 * @file diagnostics.hpp
 * @brief Warning reporting for recoverable conditions.
 *
 * Skipped directories, unreadable files and untokenizable files do not fail
 * a scan. They are reported through a WarningSink instead. The default sink
 * prints to stderr; tests and the CLI install their own.
 */

#include "classmap/error.hpp"

#include <functional>
#include <iostream>

namespace classmap {

    using WarningSink = std::function<void(const Error&)>;

    /**
     * Sink that writes "warning: classmap: <error>" to stderr.
     */
    inline WarningSink stderr_warning_sink() {
        return [](const Error& error) {
            std::cerr << "warning: classmap: " << error << "\n";
        };
    }

    /**
     * Sink that drops every warning.
     */
    inline WarningSink silent_warning_sink() {
        return [](const Error&) {};
    }

    /**
     * Forwards to the sink if one is installed.
     */
    inline void report_warning(const WarningSink& sink, const Error& error) {
        if (sink) {
            sink(error);
        }
    }

}  // namespace classmap

#endif //CLASSMAP_DIAGNOSTICS_HPP
