#pragma once

#include <string>

namespace rv {

/// Random RFC 4122 version 4 identifier, lower-case hex with dashes.
std::string generate_uuid();

} // namespace rv
