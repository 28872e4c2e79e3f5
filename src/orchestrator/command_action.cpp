// EN: Built-in `command` action: runs a shell command line or an argv list as a child process.
// FR: Action intégrée `command` : exécute une ligne shell ou une liste argv dans un processus enfant.

#include "orchestrator/action_registry.hpp"
#include "orchestrator/pipeline_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace DPF {
namespace Orchestrator {
namespace BuiltinActions {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

// EN: Child environment: inherited, then parameters, then explicit env bindings, then run identity.
// FR: Environnement enfant : hérité, puis paramètres, puis variables explicites, puis identité du run.
std::vector<std::string> buildEnvironment(const ActionContext& context) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string text(*entry);
        size_t eq = text.find('=');
        if (eq != std::string::npos) {
            merged[text.substr(0, eq)] = text.substr(eq + 1);
        }
    }
    for (const auto& [name, value] : context.parameters) {
        merged[environmentName(name)] = value;
    }
    for (const auto& [name, value] : context.environment) {
        merged[name] = value;
    }
    merged["DPF_RUN_ID"] = context.run_id;
    merged["DPF_PIPELINE"] = context.pipeline_name;
    merged["DPF_STAGE"] = context.stage_name;

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [name, value] : merged) {
        result.push_back(name + "=" + value);
    }
    return result;
}

std::vector<char*> toPointers(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(&s[0]);
    }
    pointers.push_back(nullptr);
    return pointers;
}

bool readFully(int fd, void* data, size_t size) {
    char* out = static_cast<char*>(data);
    size_t offset = 0;
    while (offset < size) {
        ssize_t n = read(fd, out + offset, size - offset);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

int exitCodeFromStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

enum class ReapResult {
    RUNNING,
    EXITED,     // EN: `status` is valid / FR: `status` est valide
    LOST        // EN: waitpid failed (ECHILD when SIGCHLD is ignored) / FR: waitpid a échoué (ECHILD si SIGCHLD est ignoré)
};

// EN: Non-blocking reap. On LOST, `wait_error` holds the waitpid errno and `status` means nothing.
// FR: Récupération non bloquante. Sur LOST, `wait_error` contient l'errno de waitpid et `status` n'a pas de sens.
ReapResult tryReap(pid_t pid, int& status, int& wait_error) {
    pid_t result = waitpid(pid, &status, WNOHANG);
    if (result == pid) {
        return ReapResult::EXITED;
    }
    if (result < 0 && errno != EINTR) {
        wait_error = errno;
        return ReapResult::LOST;
    }
    return ReapResult::RUNNING;
}

std::string lostStatusMessage(pid_t pid, int wait_error) {
    return "exit status of process " + std::to_string(pid) + " is unknown (waitpid: " +
           std::strerror(wait_error) + ")";
}

// EN: SIGTERM to the whole process group, SIGKILL after the grace period.
//     Returns the wait status, or nullopt when it could not be collected.
// FR: SIGTERM à tout le groupe de processus, SIGKILL après le délai de grâce.
//     Retourne le statut d'attente, ou nullopt s'il n'a pas pu être récupéré.
std::optional<int> terminateChild(pid_t pid, std::chrono::milliseconds grace_period, const std::string& stage_name) {
    int status = 0;
    int wait_error = 0;
    kill(-pid, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace_period;
    while (std::chrono::steady_clock::now() < deadline) {
        ReapResult reaped = tryReap(pid, status, wait_error);
        if (reaped == ReapResult::EXITED) {
            return status;
        }
        if (reaped == ReapResult::LOST) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    LOG_WARN("command", "Stage " + stage_name + " ignored SIGTERM, sending SIGKILL");
    kill(-pid, SIGKILL);
    pid_t result;
    while ((result = waitpid(pid, &status, 0)) < 0 && errno == EINTR) {
    }
    if (result != pid) {
        return std::nullopt;
    }
    return status;
}

} // namespace

ActionOutcome command(const ActionContext& context) {
    std::vector<std::string> argv_strings;
    if (!context.command.empty()) {
        argv_strings = context.command;
    } else if (!context.run.empty()) {
        argv_strings = {"/bin/sh", "-c", context.run};
    } else {
        throw ActionFailure("command action requires 'run' or 'command'");
    }

    std::vector<std::string> env_strings = buildEnvironment(context);
    std::vector<char*> argv = toPointers(argv_strings);
    std::vector<char*> envp = toPointers(env_strings);

    std::string working_directory;
    if (auto it = context.arguments.find("working_directory"); it != context.arguments.end()) {
        working_directory = it->second;
    }

    int output_fd = -1;
    if (!context.output_path.empty()) {
        output_fd = open(context.output_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (output_fd < 0) {
            throw ActionFailure("cannot open stage log " + context.output_path + ": " + std::strerror(errno));
        }
        std::string header = "[dpf] " + context.stage_name + ": " +
                             (context.run.empty() ? argv_strings.front() : context.run) + "\n";
        if (write(output_fd, header.data(), header.size()) < 0) {
            LOG_WARN("command", "Could not write to stage log " + context.output_path);
        }
    }

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);

    // EN: The exec-status pipe is close-on-exec: EOF means exec succeeded, an int means errno.
    // FR: Le pipe de statut est close-on-exec : EOF signifie exec réussi, un int signifie errno.
    int status_pipe[2] = {-1, -1};
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        int error = errno;
        if (output_fd >= 0) close(output_fd);
        if (null_fd >= 0) close(null_fd);
        throw ActionFailure(std::string("cannot create pipe: ") + std::strerror(error));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int error = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        if (output_fd >= 0) close(output_fd);
        if (null_fd >= 0) close(null_fd);
        throw ActionFailure(std::string("fork failed: ") + std::strerror(error));
    }

    if (pid == 0) {
        // EN: Child: only async-signal-safe calls until exec.
        // FR: Enfant : uniquement des appels async-signal-safe jusqu'à exec.
        setpgid(0, 0);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);

        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
        }
        if (output_fd >= 0) {
            dup2(output_fd, STDOUT_FILENO);
            dup2(output_fd, STDERR_FILENO);
        }
        if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
            int error = errno;
            ssize_t ignored = write(status_pipe[1], &error, sizeof(error));
            (void)ignored;
            _exit(127);
        }

        environ = envp.data();
        execvp(argv[0], argv.data());

        int error = errno;
        ssize_t ignored = write(status_pipe[1], &error, sizeof(error));
        (void)ignored;
        _exit(127);
    }

    // EN: Parent.
    // FR: Parent.
    setpgid(pid, pid);
    close(status_pipe[1]);
    if (output_fd >= 0) close(output_fd);
    if (null_fd >= 0) close(null_fd);

    int exec_errno = 0;
    bool exec_failed = readFully(status_pipe[0], &exec_errno, sizeof(exec_errno));
    close(status_pipe[0]);

    int status = 0;
    if (exec_failed) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return ActionOutcome::failed(127, "cannot execute '" + argv_strings.front() + "'" +
                                     (working_directory.empty() ? "" : " in " + working_directory) +
                                     ": " + std::strerror(exec_errno));
    }

    LOG_DEBUG_META("command", "Process started", (std::unordered_map<std::string, std::string>{
        {"stage", context.stage_name}, {"pid", std::to_string(pid)}, {"run_id", context.run_id}}));

    int wait_error = 0;
    ReapResult reaped;
    while ((reaped = tryReap(pid, status, wait_error)) == ReapResult::RUNNING) {
        if (context.cancel.waitFor(kPollInterval)) {
            auto final_status = terminateChild(pid, context.cancel_grace_period, context.stage_name);
            return ActionOutcome::failed(final_status ? exitCodeFromStatus(*final_status) : -1,
                                         "process terminated: " + context.cancel.reason());
        }
    }

    // EN: Without a wait status the outcome is unknown, never a success.
    // FR: Sans statut d'attente le résultat est inconnu, jamais un succès.
    if (reaped == ReapResult::LOST) {
        std::string message = lostStatusMessage(pid, wait_error);
        LOG_ERROR("command", "Stage " + context.stage_name + ": " + message);
        return ActionOutcome::failed(-1, message);
    }

    int exit_code = exitCodeFromStatus(status);
    if (exit_code == 0) {
        return ActionOutcome::succeeded();
    }
    if (WIFSIGNALED(status)) {
        return ActionOutcome::failed(exit_code, "process killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return ActionOutcome::failed(exit_code, "process exited with code " + std::to_string(exit_code));
}

} // namespace BuiltinActions
} // namespace Orchestrator
} // namespace DPF
