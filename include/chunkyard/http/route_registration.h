#pragma once

#include <memory>
#include <string>

#include "chunkyard/http/router.h"
#include "chunkyard/upload/upload_types.h"

namespace chunkyard::upload {
class UploadService;
}

namespace chunkyard::http {

/// Registers the server's HTTP routes into the provided router.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<upload::UploadService> uploads);

/// @brief JSON body for a chunk submission outcome: {"ok":..,"error"?:..,"finished"?:..}.
std::string OutcomeBody(const upload::UploadOutcome& outcome);

}  // namespace chunkyard::http
