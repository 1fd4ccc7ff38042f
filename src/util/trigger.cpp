#include "csvsplit/trigger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace csvsplit {

namespace fs = std::filesystem;

namespace {

constexpr const char* kShell = "/bin/sh";

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string full_path(const std::string& path) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(fs::absolute(path, ec), ec);
    return ec ? path : resolved.string();
}

}  // namespace

Trigger::Trigger(std::string command_template) : template_(std::move(command_template)) {}

std::string Trigger::format(const std::string& command_template,
                            const std::string& path, size_t rows) {
    std::string command = command_template;
    replace_all(command, "{}", full_path(path));
    replace_all(command, "{/}", fs::path(path).filename().string());
    replace_all(command, "{rows}", std::to_string(rows));
    return command;
}

int Trigger::run(const std::string& path, size_t rows) const {
    const std::string command = command_for(path, rows);

    // Don't let the child inherit unflushed output
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if (pid == -1) {
        std::cerr << "Warning: trigger '" << command << "' could not start: "
                  << strerror(errno) << "\n";
        return -1;
    }

    if (pid == 0) {
        execl(kShell, "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        std::cerr << "Warning: waiting for trigger '" << command << "' failed: "
                  << strerror(errno) << "\n";
        return -1;
    }

    if (!WIFEXITED(status)) {
        std::cerr << "Warning: trigger '" << command << "' terminated by signal "
                  << WTERMSIG(status) << "\n";
        return -1;
    }

    const int exit_code = WEXITSTATUS(status);
    if (exit_code != 0) {
        std::cerr << "Warning: trigger '" << command << "' exited with status "
                  << exit_code << "\n";
    }
    return exit_code;
}

}  // namespace csvsplit
