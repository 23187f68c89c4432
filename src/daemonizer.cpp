//
// Created by opencode on 18/10/2026.
//

#include "mlink/daemonizer.hpp"
#include "mlink/interactive_cli.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <limits.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace mlink {

    Daemonizer::Daemonizer(const std::string& host, int port)
        : host_(host)
        , port_(port) {}

    bool Daemonizer::is_daemon_running() {
        DaemonClient client(host_, port_);
        return client.is_daemon_running();
    }

    bool Daemonizer::spawn_daemon(const std::string& daemon_binary_path,
                                  const std::vector<std::string>& extra_args) {
        // Build argv before forking; only async-signal-safe calls after fork
        std::vector<std::string> args = {daemon_binary_path, "--daemon", "--port", std::to_string(port_)};
        args.insert(args.end(), extra_args.begin(), extra_args.end());

        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        pid_t pid = fork();
        
        if (pid < 0) {
            last_error_ = "Failed to fork: " + std::string(strerror(errno));
            return false;
        }
        
        if (pid > 0) {
            // Parent process - wait for child to finish forking
            int status;
            pid_t result = waitpid(pid, &status, 0);
            
            if (result < 0) {
                last_error_ = "Failed to wait for child: " + std::string(strerror(errno));
                return false;
            }
            
            if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
                last_error_ = "Child process failed to daemonize";
                return false;
            }
            
            return true;
        }
        
        // Child: new session, then fork again so the daemon is not a
        // session leader and can never reacquire a terminal
        if (setsid() < 0) {
            _exit(1);
        }
        
        pid_t pid2 = fork();
        if (pid2 < 0) {
            _exit(1);
        }
        
        if (pid2 > 0) {
            _exit(0);
        }
        
        if (chdir("/") < 0) {
            _exit(1);
        }
        
        close(STDIN_FILENO);
        close(STDOUT_FILENO);
        close(STDERR_FILENO);
        
        open("/dev/null", O_RDONLY);  // stdin
        open("/dev/null", O_WRONLY);  // stdout
        open("/dev/null", O_WRONLY);  // stderr
        
        execv(daemon_binary_path.c_str(), argv.data());
        
        _exit(1);
    }

    bool Daemonizer::wait_for_daemon(std::chrono::seconds timeout) {
        auto start = std::chrono::steady_clock::now();
        
        while (std::chrono::steady_clock::now() - start < timeout) {
            if (is_daemon_running()) {
                return true;
            }
            
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        
        last_error_ = "Timeout waiting for daemon to start";
        return false;
    }

    std::string Daemonizer::get_executable_path() {
        char path[PATH_MAX];
        
        #ifdef __linux__
            ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
            if (len != -1) {
                path[len] = '\0';
                return std::string(path);
            }
        #elif __APPLE__
            uint32_t size = sizeof(path);
            if (_NSGetExecutablePath(path, &size) == 0) {
                return std::string(path);
            }
        #endif
        
        return "";
    }

} // namespace mlink
