#include <catch2/catch_test_macros.hpp>

#include "shared/arg_parser.h"
#include <optional>
#include <string>
#include <vector>

using namespace ulidgen::apps;

namespace {

struct DemoConfig {
  std::optional<std::string> name;
  int verbose_count{0};
};

std::vector<Option<DemoConfig>> demo_options() {
  return {
      {"--name", "-N", true, "NAME", "Name to greet",
       [](DemoConfig& c, const std::string& v) -> std::string {
         if (v.empty()) {
           return "--name must not be empty";
         }
         c.name = v;
         return "";
       }},
      {"--verbose", "-v", false, "", "More output",
       [](DemoConfig& c, const std::string& /*v*/) -> std::string {
         ++c.verbose_count;
         return "";
       }},
  };
}

// Argv owns its strings so tests can pass argv-style arrays.
class Argv {
 public:
  explicit Argv(std::vector<std::string> args) : args_(std::move(args)) {
    for (auto& arg : args_) {
      pointers_.push_back(arg.data());
    }
  }
  int argc() const { return static_cast<int>(pointers_.size()); }
  char** argv() { return pointers_.data(); }

 private:
  std::vector<std::string> args_;
  std::vector<char*> pointers_;
};

}  // namespace

TEST_CASE("parse_options: long, short and inline-value forms", "[cli][args]") {
  const auto options = demo_options();

  SECTION("--name value") {
    Argv args({"prog", "--name", "ada"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE(result.has_value());
    CHECK(result.value().name == "ada");
  }

  SECTION("--name=value") {
    Argv args({"prog", "--name=ada"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE(result.has_value());
    CHECK(result.value().name == "ada");
  }

  SECTION("-N value and repeated flags") {
    Argv args({"prog", "-N", "ada", "-v", "--verbose"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE(result.has_value());
    CHECK(result.value().name == "ada");
    CHECK(result.value().verbose_count == 2);
  }

  SECTION("no arguments keeps defaults") {
    Argv args({"prog"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE(result.has_value());
    CHECK_FALSE(result.value().name.has_value());
    CHECK(result.value().verbose_count == 0);
  }
}

TEST_CASE("parse_options: attached and clustered short flags", "[cli][args]") {
  const auto options = demo_options();

  SECTION("-Nvalue") {
    Argv args({"prog", "-Nada"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE(result.has_value());
    CHECK(result.value().name == "ada");
  }

  SECTION("-N=value") {
    Argv args({"prog", "-N=ada"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE(result.has_value());
    CHECK(result.value().name == "ada");
  }

  SECTION("-vvN value") {
    Argv args({"prog", "-vvN", "ada"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE(result.has_value());
    CHECK(result.value().name == "ada");
    CHECK(result.value().verbose_count == 2);
  }

  SECTION("-vNada") {
    Argv args({"prog", "-vNada"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE(result.has_value());
    CHECK(result.value().name == "ada");
    CHECK(result.value().verbose_count == 1);
  }

  SECTION("unknown flag inside a cluster") {
    Argv args({"prog", "-vx"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == "unexpected argument '-x'");
  }

  SECTION("cluster ending in a value flag with nothing after it") {
    Argv args({"prog", "-vN"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == "option --name requires a value");
  }

  SECTION("-N= passes an empty value to the handler") {
    Argv args({"prog", "-N="});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == "--name must not be empty");
  }
}

TEST_CASE("parse_options: problems are reported as errors", "[cli][args]") {
  const auto options = demo_options();

  SECTION("unknown flag") {
    Argv args({"prog", "--bogus"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == "unexpected argument '--bogus'");
  }

  SECTION("stray positional token") {
    Argv args({"prog", "extra"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == "unexpected argument 'extra'");
  }

  SECTION("missing value") {
    Argv args({"prog", "--name"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == "option --name requires a value");
  }

  SECTION("value given to a plain flag") {
    Argv args({"prog", "--verbose=yes"});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == "option --verbose does not take a value");
  }

  SECTION("handler rejection") {
    Argv args({"prog", "--name="});
    const auto result = parse_options(args.argc(), args.argv(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == "--name must not be empty");
  }
}

TEST_CASE("format_options: one line per option with short form and value name",
          "[cli][args]") {
  const auto help = format_options(demo_options());
  CHECK(help.find("-N, --name <NAME>") != std::string::npos);
  CHECK(help.find("-v, --verbose") != std::string::npos);
  CHECK(help.find("Name to greet") != std::string::npos);
}
