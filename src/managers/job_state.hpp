#pragma once

#include <string>
#include <vector>

enum class Direction { Upload, Download };

enum class JobState {
    Init,
    Parsing,
    WaitingDisk,   // upload only
    Compressing,   // upload only
    Transferring,
    Verifying,
    Finalizing,    // upload only: dataset activation
    Done,
    Error,
    Aborted,
};

const char* direction_name(Direction d);
Direction parse_direction(const std::string& name);

// "init", "waiting-disk", ... as shown to users and stored on disk
const char* state_name(JobState s);
JobState parse_state(const std::string& name, JobState fallback = JobState::Init);

// Fixed step order per direction, from Init to Done.
const std::vector<JobState>& pipeline_for(Direction d);

bool in_pipeline(Direction d, JobState s);

// Done, Error and Aborted: no worker drives a job in these states.
bool is_terminal(JobState s);

// Successor of `s` in the pipeline. Throws std::logic_error for Done,
// Error, Aborted or a state outside the direction's pipeline.
JobState next_state(Direction d, JobState s);

// The only edges a job may take:
//   forward one step along the pipeline,
//   any non-terminal state -> Error or Aborted,
//   Verifying -> Transferring (re-transfer after a mismatch),
//   Error/Aborted -> a pipeline step other than Init/Done (re-attempt).
bool is_legal_transition(Direction d, JobState from, JobState to);
