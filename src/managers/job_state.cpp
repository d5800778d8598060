#include "job_state.hpp"
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>

const char* direction_name(Direction d) {
    return d == Direction::Upload ? "upload" : "download";
}

Direction parse_direction(const std::string& name) {
    if (name == "upload") return Direction::Upload;
    if (name == "download") return Direction::Download;
    throw std::invalid_argument("unknown direction: " + name);
}

const char* state_name(JobState s) {
    switch (s) {
        case JobState::Init:         return "init";
        case JobState::Parsing:      return "parsing";
        case JobState::WaitingDisk:  return "waiting-disk";
        case JobState::Compressing:  return "compressing";
        case JobState::Transferring: return "transferring";
        case JobState::Verifying:    return "verifying";
        case JobState::Finalizing:   return "finalizing";
        case JobState::Done:         return "done";
        case JobState::Error:        return "error";
        case JobState::Aborted:      return "aborted";
    }
    return "error";
}

JobState parse_state(const std::string& name, JobState fallback) {
    static const JobState all[] = {
        JobState::Init, JobState::Parsing, JobState::WaitingDisk,
        JobState::Compressing, JobState::Transferring, JobState::Verifying,
        JobState::Finalizing, JobState::Done, JobState::Error, JobState::Aborted,
    };
    for (auto s : all) {
        if (name == state_name(s)) return s;
    }
    return fallback;
}

const std::vector<JobState>& pipeline_for(Direction d) {
    static const std::vector<JobState> upload = {
        JobState::Init, JobState::Parsing, JobState::WaitingDisk,
        JobState::Compressing, JobState::Transferring, JobState::Verifying,
        JobState::Finalizing, JobState::Done,
    };
    static const std::vector<JobState> download = {
        JobState::Init, JobState::Parsing, JobState::Transferring,
        JobState::Verifying, JobState::Done,
    };
    return d == Direction::Upload ? upload : download;
}

bool in_pipeline(Direction d, JobState s) {
    const auto& p = pipeline_for(d);
    return std::find(p.begin(), p.end(), s) != p.end();
}

bool is_terminal(JobState s) {
    return s == JobState::Done || s == JobState::Error || s == JobState::Aborted;
}

JobState next_state(Direction d, JobState s) {
    const auto& p = pipeline_for(d);
    auto it = std::find(p.begin(), p.end(), s);
    if (it == p.end() || s == JobState::Done) {
        throw std::logic_error(fmt::format("no {} step follows '{}'",
                                           direction_name(d), state_name(s)));
    }
    return *(it + 1);
}

bool is_legal_transition(Direction d, JobState from, JobState to) {
    if (from == to) return false;

    if (from == JobState::Error || from == JobState::Aborted) {
        return in_pipeline(d, to) && to != JobState::Init && to != JobState::Done;
    }
    if (from == JobState::Done) return false;
    if (!in_pipeline(d, from)) return false;

    if (to == JobState::Error || to == JobState::Aborted) return true;
    if (from == JobState::Verifying && to == JobState::Transferring) return true;
    return next_state(d, from) == to;
}
