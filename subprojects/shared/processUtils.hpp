#pragma once
#include <string>

class ProcessUtils {
public:
    // Set current thread name (best-effort, platform-specific). Returns false
    // when the platform refused the name.
    static bool set_current_thread_name(const std::string& name);
};
