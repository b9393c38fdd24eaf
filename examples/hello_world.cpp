#include <iostream>
#include <loom/primitives.hpp>
#include <string>
#include <vector>

using namespace loom::primitives;

auto main() -> int {
  init_logger();

  // parse -> double -> three concurrent formatters
  auto parse   = lambda<std::string>([](const std::string& s) { return std::stoi(s); }, "parse");
  auto doubled = lambda<int>([](int x) { return x * 2; }, "double");
  auto fanout  = lambda<int>([](int x) { return "dec " + std::to_string(x); }, "dec")
               | lambda<int>([](int x) { return "neg " + std::to_string(-x); }, "neg")
               | lambda<int>([](int x) { return "sq " + std::to_string(x * x); }, "sq");

  auto workflow = parse >> doubled >> fanout;

  context ctx;
  for (const auto& line : workflow->execute("21", ctx)) {
    std::cout << line << '\n';
  }
  std::cout << "correlation: " << ctx.correlation_id() << '\n';
  return 0;
}
