#pragma once

#include <cstddef>
#include <cstdlib>
#include <iostream>

// Debug-only invariant checks for the filter core. A failed check prints
//   [lopass] <function>: check `<expr>` failed (<file>:<line>) <detail>
// to std::cerr and aborts. All macros compile out under NDEBUG.

namespace lopass::dsp::detail {

inline void report_check(const char *expr, const char *func, const char *file, int line) {
    std::cerr << "[lopass] " << func << ": check `" << expr << "` failed (" << file << ':' << line << ')';
}

[[noreturn]] inline void check_failed(const char *expr,
                                      const char *func,
                                      const char *file,
                                      int line,
                                      const char *message) {
    report_check(expr, func, file, line);
    if (message && *message)
        std::cerr << ' ' << message;
    std::cerr << std::endl;
    std::abort();
}

[[noreturn]] inline void range_failed(const char *expr,
                                      const char *func,
                                      const char *file,
                                      int line,
                                      std::size_t index,
                                      std::size_t size) {
    report_check(expr, func, file, line);
    std::cerr << " index " << index << " outside [0, " << size << ')' << std::endl;
    std::abort();
}

} // namespace lopass::dsp::detail

#ifndef NDEBUG
#define dsp_assert(cond)                                                                           \
    do {                                                                                           \
        if (!(cond))                                                                               \
            lopass::dsp::detail::check_failed(#cond, __func__, __FILE__, __LINE__, nullptr);       \
    } while (0)
#define dsp_assert_msg(cond, msg)                                                                  \
    do {                                                                                           \
        if (!(cond))                                                                               \
            lopass::dsp::detail::check_failed(#cond, __func__, __FILE__, __LINE__, (msg));         \
    } while (0)
// Checks index < size for ring and tap indexing.
#define dsp_assert_index(index, size)                                                              \
    do {                                                                                           \
        const std::size_t lopass_i_ = static_cast<std::size_t>(index);                             \
        const std::size_t lopass_n_ = static_cast<std::size_t>(size);                              \
        if (!(lopass_i_ < lopass_n_))                                                              \
            lopass::dsp::detail::range_failed(#index " < " #size, __func__, __FILE__, __LINE__,    \
                                              lopass_i_, lopass_n_);                               \
    } while (0)
#else
#define dsp_assert(cond) ((void)0)
#define dsp_assert_msg(cond, msg) ((void)0)
#define dsp_assert_index(index, size) ((void)0)
#endif
