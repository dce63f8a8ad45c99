#pragma once

#include <atomic>

namespace rfaccess {
namespace runtime {

// SIGINT/SIGTERM set a process-wide shutdown flag. Handlers are installed
// without SA_RESTART so a blocking read on stdin returns and the tool loop
// can observe the flag.
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Tests only
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace rfaccess
