#pragma once

#include <string>
#include <vector>

#include "a2a/client/downstream_caller.hpp"
#include "a2a/coordinator/pipeline_step.hpp"
#include "a2a/core/types.hpp"
#include "a2a/runtime/handler.hpp"

namespace a2a {

struct CoordinatorOptions {
  std::string success_text = "Workflow completed successfully!";
  std::string error_prefix = "Error in workflow: ";
};

// Coordinator
//
// Runs the configured steps strictly in order. Every step sends
// prompt_prefix + <original inbound text> to its agent as one message/send.
// The first failing step (timeout, transport error, error envelope, or a
// downstream task that ended failed/rejected/canceled) stops the pipeline;
// the reply then still carries the results of the steps that succeeded.
class CoordinatorHandler : public CapabilityHandler {
 public:
  CoordinatorHandler(std::vector<PipelineStep> steps, DownstreamCallerPtr caller, CoordinatorOptions options = {});

  HandlerResult handle(const Message& inbound, const Task& task, const HandlerContext& ctx) override;

  const std::vector<PipelineStep>& steps() const {
    return steps_;
  }

 private:
  // Downstream result (the remote Task) or the failure description
  Result<json> run_step(const PipelineStep& step, const std::string& text) const;

  std::vector<PipelineStep> steps_;
  DownstreamCallerPtr caller_;
  CoordinatorOptions options_;
};

}  // namespace a2a
