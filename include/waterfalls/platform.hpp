#pragma once
/**
 * @file platform.hpp
 * @brief Clock, thread id and process identity helpers.
 *
 * Everything OS-specific lives here so the rest of the library only deals
 * with plain int64 nanoseconds and integer ids.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

#include "types/enums.hpp"

#ifdef _WIN32
#include <windows.h>
#include <process.h>
// Undefine Windows macros that conflict with std::min/max
#undef min
#undef max
#else
#include <pthread.h>
#include <time.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#endif
#endif

namespace waterfalls {

/**
 * @brief Monotonic wall-clock time in nanoseconds.
 *
 * Only differences between two values are meaningful; the epoch is
 * unspecified but shared by all threads and processes of one boot.
 */
inline int64_t now_ns() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return (int64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
}

/**
 * @brief CPU time consumed so far by the calling thread, in nanoseconds.
 */
inline int64_t thread_cpu_ns() {
#ifdef _WIN32
    FILETIME creation, exit_time, kernel, user;
    if (!GetThreadTimes(GetCurrentThread(), &creation, &exit_time, &kernel, &user)) {
        return 0;
    }
    ULARGE_INTEGER k, u;
    k.LowPart = kernel.dwLowDateTime;  k.HighPart = kernel.dwHighDateTime;
    u.LowPart = user.dwLowDateTime;    u.HighPart = user.dwHighDateTime;
    // FILETIME ticks are 100 ns
    return (int64_t)((k.QuadPart + u.QuadPart) * 100);
#else
    struct timespec ts;
    if (clock_gettime(CLOCK_THREAD_CPUTIME_ID, &ts) != 0) {
        return 0;
    }
    return (int64_t)ts.tv_sec * 1000000000LL + (int64_t)ts.tv_nsec;
#endif
}

/**
 * @brief OS-native id of the calling thread.
 *
 * Matches the id shown by system tools (top -H, Process Explorer), so
 * report rows can be correlated with other profilers.
 */
inline uint64_t native_thread_id() {
#if defined(_WIN32)
    return (uint64_t)GetCurrentThreadId();
#elif defined(__linux__)
    return (uint64_t)::syscall(SYS_gettid);
#elif defined(__APPLE__)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#else
    return (uint64_t)std::hash<std::thread::id>{}(std::this_thread::get_id());
#endif
}

/**
 * @brief Id of the calling process.
 */
inline int64_t current_pid() {
#ifdef _WIN32
    return (int64_t)_getpid();
#else
    return (int64_t)::getpid();
#endif
}

namespace internal {

// Captured during static initialization of the first process that loads the
// library; forked children inherit the parent's value.
inline const int64_t g_main_pid = current_pid();

} // namespace internal

/**
 * @brief Pid of the process considered "main" for report naming.
 */
inline int64_t main_pid() {
    return internal::g_main_pid;
}

/**
 * @brief Role of the calling process: Child when forked from the main process.
 */
inline ProcessRole current_process_role() {
    return current_pid() == main_pid() ? ProcessRole::Main : ProcessRole::Child;
}

} // namespace waterfalls
