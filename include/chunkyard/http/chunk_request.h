#pragma once

#include <string>

#include "chunkyard/core/result.h"
#include "chunkyard/upload/upload_types.h"

namespace chunkyard::http {

/// Form field names of a chunk submission (multipart/form-data).
inline constexpr const char* kMarkerField = "bigFileUpload";
inline constexpr const char* kInfoField = "info";
inline constexpr const char* kFileField = "file";

/// @brief Parse the JSON metadata object {uploadId, uploadSize, part, total}.
/// Only types are checked here; value ranges are the upload service's concern.
core::Result<upload::ChunkInfo> ParseChunkInfo(const std::string& json);

/// @brief Parse a form-encoded chunk submission body.
///
/// Fails with kInvalidArgument "Not a chunked upload request" when the marker field is
/// absent or not "true", and with "Invalid request" when the metadata is not well-formed.
/// A missing file field is not an error here; has_payload reports it.
core::Result<upload::ChunkSubmission> ParseChunkRequest(const std::string& content_type,
                                                        const std::string& body);

}  // namespace chunkyard::http
