#pragma once

#include "pipeline.hpp"

// init -> parsing -> waiting-disk -> compressing -> transferring
//      -> verifying -> finalizing -> done
class UploadPipeline : public Pipeline {
public:
    Direction direction() const override { return Direction::Upload; }

    StepOutcome run_step(Job& job, StepContext& ctx) override;
    void on_abort(Job& job, StepContext& ctx) override;
    void on_done(Job& job, StepContext& ctx) override;
    void on_remove(Job& job, StepContext& ctx) override;
    void reconcile(Job& job, StepContext& ctx) override;

    // Remote name of a resource: ".gz" appended when it is compressed.
    static std::string upload_name(const ResourceSpec& spec, bool compressed);

private:
    StepOutcome parse(Job& job, StepContext& ctx);
    StepOutcome wait_disk(Job& job, StepContext& ctx);
    StepOutcome compress(Job& job, StepContext& ctx);
    StepOutcome transfer(Job& job, StepContext& ctx);
    StepOutcome verify(Job& job, StepContext& ctx);
    StepOutcome finalize(Job& job, StepContext& ctx);

    void send_resource(Job& job, StepContext& ctx, size_t index);
    void send_supplements(Job& job, StepContext& ctx, size_t index);
    fs::path ensure_payload(Job& job, StepContext& ctx, size_t index);
};
