#include "chunkyard/core/ids.h"

#include <cctype>

#include <Poco/UUID.h>
#include <Poco/UUIDGenerator.h>

namespace chunkyard::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

bool IsCanonicalUuid(const std::string& value) {
    // Poco::UUID::tryParse also accepts the 32-digit form without dashes; staging
    // directory names are derived from this text, so only the dashed form is allowed.
    if (value.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        const bool dash_position = i == 8 || i == 13 || i == 18 || i == 23;
        if (dash_position) {
            if (value[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    Poco::UUID uuid;
    return uuid.tryParse(value);
}

}  // namespace chunkyard::core
