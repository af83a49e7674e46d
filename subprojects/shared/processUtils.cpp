#include "processUtils.hpp"
#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

bool ProcessUtils::set_current_thread_name(const std::string& name) {
#if defined(__linux__)
    // Linux limits thread names to 15 characters plus the terminator.
    const std::string truncated = name.substr(0, 15);
    return pthread_setname_np(pthread_self(), truncated.c_str()) == 0;
#elif defined(__APPLE__)
    return pthread_setname_np(name.c_str()) == 0;
#else
    (void)name;
    return false;
#endif
}
