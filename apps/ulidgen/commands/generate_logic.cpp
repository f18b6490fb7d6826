#include "generate_logic.h"

#include "ulidgen/ulid/codec.h"

#include "error_text.h"

namespace ulidgen::cli {

int execute_generate(const GenerateRequest& request, ulid::MonotonicGenerator& generator,
                     std::ostream& out, std::ostream& err) {
  for (std::uint32_t i = 0; i < request.count; ++i) {
    const auto result = request.pinned_timestamp_ms.has_value()
                            ? generator.generate_at(request.pinned_timestamp_ms.value())
                            : generator.generate();

    if (!result.has_value()) {
      err << "Error: generate ULID"
          << (request.pinned_timestamp_ms.has_value() ? " from pinned timestamp" : "") << ": "
          << describe_error(result.error()) << "\n";
      return 1;
    }

    out << ulid::encode(result.value(), request.letter_case) << "\n";
  }
  return 0;
}

}  // namespace ulidgen::cli
