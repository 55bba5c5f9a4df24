#pragma once

#include "upstream/upstream_client.hpp"

#include <string>
#include <string_view>

namespace labgate::upstream {

// Schema checks for 2xx upstream bodies. A false return is reported to the
// router as `kMalformedResponse`, so the normalizer only ever sees complete
// responses.
//
// Inference contract:
// - body is an object
// - `text` (or the legacy `output`) is a string, unless the upstream reports
//   `success: false` or a non-null `error`
// - `metrics`, when present and not null, is an object; its numeric members
//   are kept, anything else is ignored
bool ParseInferenceResponse(std::string_view body, InferenceResponse& response,
                            std::string& error);

// Orchestration contract:
// - body is an object
// - `nodes` (or `flow.nodes`) is an array of objects, each with a string
//   `name` (legacy `id` accepted) and a known string `status`
// - `output`, `id`, `type` and `error` are optional strings
// - `nodes` may be empty only when the upstream reports an `error`
bool ParseOrchestrationResponse(std::string_view body, OrchestrationResponse& response,
                                std::string& error);

} // namespace labgate::upstream
