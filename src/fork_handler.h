// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_FORK_HANDLER_H_INCLUDED
#define HEADER_MODERN_ULID_FORK_HANDLER_H_INCLUDED

#include <modern-ulid/common.h>

#if __has_include(<unistd.h>)
    #include <unistd.h>
    #include <pthread.h>
    #include <signal.h>

    #define MULID_HANDLE_FORK 1

#else
    #define MULID_HANDLE_FORK 0
#endif

#include <exception>

namespace mulid::impl {

#if MULID_HANDLE_FORK

    /**
     * Per-thread lazily constructed object that is re-created in a child
     * process on first access after fork()
     */
    template<class T, int Disambiguator = 0>
    class reset_on_fork_thread_local {
    private:
        using sig_atomic_counter = std::make_unsigned_t<sig_atomic_t>;
    public:
        static T & instance() {

            [[maybe_unused]]
            static int registered = []() {
                if (pthread_atfork(nullptr, nullptr, after_fork_in_child) != 0)
                    std::terminate();
                return 1;
            }();

            if (!tl_inst.m_obj || tl_inst.m_generation != s_generation) {
                tl_inst.m_obj.reset();
                //this can throw
                tl_inst.m_obj.emplace();
                tl_inst.m_generation = s_generation;
            }

            return *tl_inst.m_obj;
        }
    private:
        static void after_fork_in_child() {
            //NOTE 1: only signal safe functions can be called here!
            //NOTE 2: only one thread is running here
            s_generation = s_generation + 1;
        }

        reset_on_fork_thread_local() = default;
        ~reset_on_fork_thread_local() = default;
        reset_on_fork_thread_local(const reset_on_fork_thread_local &) = delete;
        reset_on_fork_thread_local & operator=(const reset_on_fork_thread_local &) = delete;

    private:
        sig_atomic_counter m_generation = 0;
        std::optional<T> m_obj;

        static inline volatile sig_atomic_counter s_generation = 0;
        static thread_local inline reset_on_fork_thread_local tl_inst{};
    };

#else //!MULID_HANDLE_FORK

    template<class T, int Disambiguator = 0>
    class reset_on_fork_thread_local {
    public:
        static T & instance() {

            thread_local T obj;
            return obj;
        }
    private:
        reset_on_fork_thread_local() = delete;
        ~reset_on_fork_thread_local() = delete;
        reset_on_fork_thread_local(const reset_on_fork_thread_local &) = delete;
        reset_on_fork_thread_local & operator=(const reset_on_fork_thread_local &) = delete;
    };

#endif //MULID_HANDLE_FORK

}

#endif
