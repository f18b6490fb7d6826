#include "error_text.h"

namespace ulidgen::cli {

std::string describe_error(ulid::UlidError error) {
  switch (error) {
    case ulid::UlidError::kInvalidLength:
      return "invalid length";
    case ulid::UlidError::kInvalidCharacter:
      return "invalid character";
    case ulid::UlidError::kOverflow:
      return "value exceeds 128 bits";
    case ulid::UlidError::kTimestampOverflow:
      return "timestamp exceeds 48 bits";
    case ulid::UlidError::kRandomOverflow:
      return "random bits overflow";
  }
  return "unknown error";
}

}  // namespace ulidgen::cli
