#pragma once

#include "ulidgen/ulid/ulid.h"

#include <string>

namespace ulidgen::cli {

// describe_error maps a core error kind to the message shown on stderr.
[[nodiscard]] std::string describe_error(ulid::UlidError error);

}  // namespace ulidgen::cli
