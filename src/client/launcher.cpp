#include "client/launcher.hpp"

#include <fcntl.h>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace pokeme::client {

using core::errors::BrokerError;
using core::errors::ErrorCategory;

namespace {

// Double fork so the broker is reparented to init and outlives the caller.
core::errors::Result<bool> spawn_detached(const std::filesystem::path& executable,
                                          const std::uint16_t port) {
    const std::string exe = executable.string();
    const std::string port_text = std::to_string(port);

    const pid_t pid = fork();
    if (pid < 0) {
        return BrokerError{ErrorCategory::Internal, "Failed to fork broker process.",
                           "fork_failed"};
    }

    if (pid == 0) {
        if (setsid() < 0) {
            _exit(126);
        }
        const pid_t grandchild = fork();
        if (grandchild != 0) {
            _exit(grandchild < 0 ? 126 : 0);
        }

        const int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(dup2(devnull, STDOUT_FILENO));
            static_cast<void>(dup2(devnull, STDERR_FILENO));
            if (devnull > STDERR_FILENO) {
                static_cast<void>(close(devnull));
            }
        }
        execl(exe.c_str(), exe.c_str(), "serve", "--port", port_text.c_str(),
              static_cast<char*>(nullptr));
        _exit(127);
    }

    int status = 0;
    static_cast<void>(waitpid(pid, &status, 0));
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return BrokerError{ErrorCategory::Internal, "Failed to detach broker process.",
                           "spawn_failed"};
    }
    return true;
}

}  // namespace

core::errors::Result<std::filesystem::path> current_executable() {
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return BrokerError{ErrorCategory::Internal,
                           "Unable to resolve own executable: " + ec.message(),
                           "executable_not_found"};
    }
    return path;
}

core::errors::Result<bool> ensure_broker(BrokerApi& api, const LaunchOptions& options) {
    if (api.health()) {
        return true;
    }

    POKEME_LOG_DEBUG("Launcher: starting broker on port " + std::to_string(options.port));
    auto spawned = spawn_detached(options.executable, options.port);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }

    for (int attempt = 0; attempt < options.readiness_attempts; ++attempt) {
        if (api.health()) {
            return true;
        }
        std::this_thread::sleep_for(options.readiness_interval);
    }

    POKEME_LOG_WARN("Launcher: broker may not have started on port " +
                    std::to_string(options.port));
    return false;
}

}  // namespace pokeme::client
