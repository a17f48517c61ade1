/**
 * @file example_processes.cpp
 * @brief Forked children each write their own report.
 *
 * Children save waterfalls.<pid>.json on every stop() and leave through
 * _exit(), so the exit-time save never runs for them. The parent writes
 * waterfalls.json at exit. The viewer merges all files of the directory.
 */

#include <waterfalls/waterfalls.hpp>
#include <chrono>
#include <string>
#include <cstdio>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

static void child_work(int id) {
    waterfalls::Timer t("Child");
    t.start("child " + std::to_string(id));
    std::this_thread::sleep_for(std::chrono::milliseconds(20 * (id + 1)));
    t.stop();
}

int main(int argc, char** argv) {
    if (argc > 1) {
        waterfalls::config.output_dir = argv[1];
    }

    waterfalls::Timer parent("Parent");
    parent.start("spawn");

    std::vector<pid_t> children;
    for (int i = 0; i < 3; ++i) {
        pid_t pid = fork();
        if (pid == 0) {
            child_work(i);
            _exit(0);
        }
        if (pid < 0) {
            std::perror("fork");
            break;
        }
        children.push_back(pid);
    }
    parent.stop();

    parent.start("wait");
    for (pid_t pid : children) {
        int status = 0;
        waitpid(pid, &status, 0);
    }
    parent.stop();
    return 0;
}
