// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/proc_info.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace kiosk {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/// cmdline is NUL-separated with a trailing NUL
std::vector<std::string> split_cmdline(const std::string& raw) {
    std::vector<std::string> argv;
    size_t start = 0;
    while (start < raw.size()) {
        size_t end = raw.find('\0', start);
        if (end == std::string::npos) {
            end = raw.size();
        }
        argv.emplace_back(raw, start, end - start);
        start = end + 1;
    }
    return argv;
}

bool parse_pid(const std::string& name, pid_t& pid) {
    if (name.empty() || !std::all_of(name.begin(), name.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    try {
        pid = static_cast<pid_t>(std::stol(name));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

ProcInfoReader::ProcInfoReader(std::string proc_root)
    : proc_root_(std::move(proc_root)),
      sleep_([](std::chrono::seconds d) { std::this_thread::sleep_for(d); }) {}

bool ProcInfoReader::read_stat(pid_t pid, PidInfo& info) const {
    std::string stat = read_file(proc_root_ + "/" + std::to_string(pid) + "/stat");
    if (stat.empty()) {
        return false;
    }

    // "pid (comm) state ppid ..." where comm may itself contain spaces and ')'
    size_t comm_start = stat.find('(');
    size_t comm_end = stat.rfind(')');
    if (comm_start == std::string::npos || comm_end == std::string::npos ||
        comm_end <= comm_start || comm_end + 2 >= stat.size()) {
        spdlog::debug("[ProcInfo] PID {}: malformed stat", pid);
        return false;
    }

    info.pid = pid;
    info.command = stat.substr(comm_start + 1, comm_end - comm_start - 1);

    std::istringstream iss(stat.substr(comm_end + 2));
    std::string state;
    long pgrp = 0, session = 0, tty_nr = 0, tpgid = 0;
    unsigned long flags = 0, minflt = 0, cminflt = 0, majflt = 0, cmajflt = 0;
    unsigned long utime = 0, stime = 0;
    long cutime = 0, cstime = 0, num_threads = 0, itrealvalue = 0;
    unsigned long long starttime = 0;
    unsigned long vsize = 0;

    iss >> state >> info.ppid >> pgrp >> session >> tty_nr >> tpgid >> flags >> minflt >>
        cminflt >> majflt >> cmajflt >> utime >> stime >> cutime >> cstime >> info.priority >>
        info.nice >> num_threads >> itrealvalue >> starttime >> vsize >> info.rss_pages;

    if (state.empty()) {
        spdlog::debug("[ProcInfo] PID {}: no state in stat", pid);
        return false;
    }
    info.state = state[0];
    info.vsize_kib = vsize / 1024;
    return true;
}

std::optional<PidInfo> ProcInfoReader::read_pid_info(pid_t pid) const {
    PidInfo info;
    if (!read_stat(pid, info)) {
        return std::nullopt;
    }

    std::vector<std::string> argv =
        split_cmdline(read_file(proc_root_ + "/" + std::to_string(pid) + "/cmdline"));
    if (!argv.empty()) {
        info.command = argv.front();
        info.args.assign(argv.begin() + 1, argv.end());
    }

    info.children = child_pids(pid);
    return info;
}

std::vector<pid_t> ProcInfoReader::child_pids(pid_t ppid) const {
    std::vector<pid_t> children;

    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    if (ec) {
        spdlog::warn("[ProcInfo] Cannot list {}: {}", proc_root_, ec.message());
        return children;
    }

    for (const auto& entry : it) {
        pid_t pid = 0;
        if (!parse_pid(entry.path().filename().string(), pid)) {
            continue;
        }
        // Processes come and go while we scan; a vanished one just fails to parse
        PidInfo info;
        if (read_stat(pid, info) && info.ppid == ppid) {
            children.push_back(pid);
        }
    }

    std::sort(children.begin(), children.end());
    return children;
}

std::optional<pid_t> ProcInfoReader::wait_for_child(pid_t ppid,
                                                    std::chrono::seconds timeout) const {
    auto waited = std::chrono::seconds(0);
    while (true) {
        std::vector<pid_t> children = child_pids(ppid);
        if (!children.empty()) {
            spdlog::debug("[ProcInfo] PID {} has child {} after {}s", ppid, children.front(),
                          waited.count());
            return children.front();
        }
        if (waited >= timeout) {
            spdlog::warn("[ProcInfo] No child of PID {} appeared within {}s", ppid,
                         timeout.count());
            return std::nullopt;
        }
        sleep_(CHILD_POLL_INTERVAL);
        waited += CHILD_POLL_INTERVAL;
    }
}

} // namespace kiosk
