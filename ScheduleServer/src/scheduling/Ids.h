#pragma once

#include <string>

namespace scheduling {

// Random RFC 4122 version 4 id, lowercase hex with dashes. Throws std::runtime_error
// when the OpenSSL generator cannot be seeded.
std::string new_id();

bool looks_like_id(const std::string& s);

}
