#pragma once

#include "pipeline.hpp"

// init -> parsing -> transferring -> verifying -> done
//
// Bytes land in <download_dir>/<dataset>/<name>~ and are renamed into
// place only once verified. Condensed RT-DC copies land beside the
// original as <stem>_condensed.<suffix> and are not checksummed.
class DownloadPipeline : public Pipeline {
public:
    Direction direction() const override { return Direction::Download; }

    StepOutcome run_step(Job& job, StepContext& ctx) override;
    void on_abort(Job& job, StepContext& ctx) override;
    void on_done(Job& job, StepContext& ctx) override;
    void on_remove(Job& job, StepContext& ctx) override;
    void reconcile(Job& job, StepContext& ctx) override;

private:
    StepOutcome parse(Job& job, StepContext& ctx);
    StepOutcome transfer(Job& job, StepContext& ctx);
    StepOutcome verify(Job& job, StepContext& ctx);
};

// "cells.rtdc" -> "cells_condensed.rtdc"
std::string condensed_name(const std::string& name);
