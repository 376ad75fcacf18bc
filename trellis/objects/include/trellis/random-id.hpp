#pragma once

#include <functional>
#include <string>

namespace trellis {

/// Returns a random RFC 4122 version 4 UUID in its canonical 36 chars lower case form, drawn from the OpenSSL
/// CSPRNG. Throws std::runtime_error if the generator cannot be seeded.
std::string RandomUuid();

/// Source of fresh identifiers, injectable for deterministic tests.
using IdGenerator = std::function<std::string()>;

}  // namespace trellis
