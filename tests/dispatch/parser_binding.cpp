#include <biodispatch/dispatch/parser_binding.hpp>
#include <catch.hpp>
#include <any>
#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace biodispatch;

TEST_CASE("options_match - Literal subset check", "[ParserBinding]") {
  const auto args = std::vector<std::string>{"-c", "-f", "ref.fa", "in.bam"};

  REQUIRE(options_match(args, {}));
  REQUIRE(options_match(args, {"-c"}));
  REQUIRE(options_match(args, {"-c", "-f"}));
  REQUIRE_FALSE(options_match(args, {"-c", "-v"}));
  REQUIRE_FALSE(options_match({"-cv"}, {"-c"}));
  REQUIRE_FALSE(options_match({}, {"-c"}));
}

TEST_CASE("select_parser - First match in registration order", "[ParserBinding]") {
  auto bindings = std::vector<ParserBinding>{
    make_parser({"-c", "-g"}, [](const std::string&) { return 1; }),
    make_parser({"-c"}, [](const std::string&) { return 2; }),
    make_parser({}, [](const std::string&) { return 3; }),
  };
  auto pick = [&bindings](std::vector<std::string> args) {
    const auto* binding = select_parser(bindings, args);
    REQUIRE(binding != nullptr);
    return std::any_cast<int>(binding->transform("", CallOptions{}));
  };

  REQUIRE(pick({"-g", "-c"}) == 1);
  REQUIRE(pick({"-c"}) == 2);
  REQUIRE(pick({"-g"}) == 3);

  SECTION("general binding first shadows the rest") {
    std::swap(bindings.front(), bindings.back());
    REQUIRE(pick({"-g", "-c"}) == 3);
  }

  SECTION("no binding") {
    bindings.pop_back();
    REQUIRE(select_parser(bindings, {"-g"}) == nullptr);
    REQUIRE(select_parser({}, {"-c"}) == nullptr);
  }
}

TEST_CASE("make_parser - Wraps both callable shapes", "[ParserBinding]") {
  auto by_output = make_parser({}, [](const std::string& output) {
    return output.size();
  });
  auto by_options
    = make_parser({"-x"}, [](const std::string& output, const CallOptions& options) {
        return options.raw ? std::string{"raw"} : output;
      });

  REQUIRE(std::any_cast<std::size_t>(by_output.transform("abc", {})) == 3);
  REQUIRE(std::any_cast<std::string>(by_options.transform("abc", {})) == "abc");
  REQUIRE(by_options.required_options == std::set<std::string>{"-x"});
}
