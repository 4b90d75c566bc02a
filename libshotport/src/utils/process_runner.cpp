//
// Created by the shotport authors on 07/11/25.
//

#include "../../include/process_runner.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <fcntl.h>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

extern char **environ;

namespace shotport {

    namespace {

        /**
         * @brief RAII owner of a file descriptor.
         */
        struct Fd {
            int fd = -1;

            explicit Fd(const int f = -1) : fd(f) {}

            ~Fd() { reset(); }

            Fd(const Fd&) = delete;
            Fd& operator=(const Fd&) = delete;

            void reset() {
                if (fd >= 0) ::close(fd);
                fd = -1;
            }
        };

        /**
         * @brief RAII wrapper for posix_spawn_file_actions_t.
         */
        struct SpawnActions {
            posix_spawn_file_actions_t actions{};

            SpawnActions() {
                if (const int rc = posix_spawn_file_actions_init(&actions); rc != 0) {
                    throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions_init");
                }
            }

            ~SpawnActions() { posix_spawn_file_actions_destroy(&actions); }

            SpawnActions(const SpawnActions&) = delete;
            SpawnActions& operator=(const SpawnActions&) = delete;
        };

    } // namespace

    ProcessResult run_process(const std::vector<std::string>& argv) {
        if (argv.empty()) {
            throw std::invalid_argument("run_process: empty argv");
        }

        int fds[2];
        // close-on-exec so children spawned by other workers do not inherit the pipe
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
        Fd read_end(fds[0]);
        Fd write_end(fds[1]);

        SpawnActions sa;
        posix_spawn_file_actions_adddup2(&sa.actions, write_end.fd, STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&sa.actions, write_end.fd, STDERR_FILENO);

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            cargv.push_back(const_cast<char*>(a.c_str()));
        }
        cargv.push_back(nullptr);

        pid_t pid = 0;
        if (const int rc = posix_spawnp(&pid, cargv[0], &sa.actions, nullptr, cargv.data(), environ); rc != 0) {
            throw std::system_error(rc, std::generic_category(), "Cannot start " + argv[0]);
        }
        write_end.reset();

        ProcessResult result;
        char buf[4096];
        for (;;) {
            const ssize_t n = ::read(read_end.fd, buf, sizeof(buf));
            if (n > 0) {
                result.output.append(buf, static_cast<std::size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                Logger::log(LogLevel::Warning, "read from " + argv[0] + " failed", "process");
                break;
            }
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw std::system_error(errno, std::generic_category(), "waitpid " + argv[0]);
            }
        }
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
        return result;
    }

} // namespace shotport
