// EN: External command execution: the runner interface used by the build phase and its POSIX implementation.
// FR: Exécution de commandes externes : l'interface utilisée par la phase de build et son implémentation POSIX.

#pragma once

#include "infrastructure/threading/cancellation.hpp"

#include <filesystem>
#include <future>
#include <string>
#include <vector>

namespace SSD {

class ThreadPool;

// EN: Program and arguments; arguments[0] is looked up in PATH.
// FR: Programme et arguments ; arguments[0] est recherché dans le PATH.
struct CommandSpec {
    std::vector<std::string> arguments;

    // EN: Arguments joined by spaces, e.g. "npm run build".
    // FR: Arguments joints par des espaces, ex. "npm run build".
    std::string display() const;
};

struct CommandResult {
    int exit_code = 0;
    std::string standard_error;
    std::string standard_output;
};

// EN: Runs a command to completion. The future carries the result or an exception
//     (OperationCancelledError when the token fired, std::system_error on spawn failure).
// FR: Exécute une commande jusqu'à son terme. Le future porte le résultat ou une exception
//     (OperationCancelledError si le token a été déclenché, std::system_error si le lancement échoue).
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual std::future<CommandResult> run(const CommandSpec& command,
                                           const std::filesystem::path& working_directory,
                                           const CancellationToken& token) = 0;
};

// EN: fork/execvp runner. stdout and stderr are captured through pipes; stdin is /dev/null.
//     On cancellation the child's process group receives SIGTERM, then SIGKILL after a grace period.
// FR: Runner fork/execvp. stdout et stderr sont capturés par des pipes ; stdin est /dev/null.
//     En cas d'annulation, le groupe de processus reçoit SIGTERM, puis SIGKILL après un délai de grâce.
class PosixCommandRunner : public ICommandRunner {
public:
    explicit PosixCommandRunner(ThreadPool& pool);

    std::future<CommandResult> run(const CommandSpec& command,
                                   const std::filesystem::path& working_directory,
                                   const CancellationToken& token) override;

    // EN: Synchronous variant, executed on the calling thread.
    // FR: Variante synchrone, exécutée sur le thread appelant.
    CommandResult execute(const CommandSpec& command,
                          const std::filesystem::path& working_directory,
                          const CancellationToken& token) const;

private:
    ThreadPool& pool_;
};

} // namespace SSD
