// router_tests.cpp
// Route selection, defaults and routing failures

#include <boost/ut.hpp>
#include <cctype>
#include <loom/primitives.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

int main() {
  using namespace boost::ut;
  using namespace loom::primitives;

  auto by_prefix = [](const std::string& s, const context&) -> std::string {
    return s.substr(0, s.find(':'));
  };

  auto routes = [] {
    return std::map<std::string, primitive_ptr<std::string, std::string>>{
        {"upper", lambda<std::string>(
                      [](std::string s) {
                        for (auto& c : s) {
                          c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                        }
                        return s;
                      },
                      "upper")},
        {"echo", lambda<std::string>([](std::string s) { return s; }, "echo")},
    };
  };

  "selects_exactly_one_route"_test = [&] {
    auto    r = route_by<std::string, std::string>(by_prefix, routes());
    context ctx;
    expect(eq(r->execute("upper:abc", ctx), std::string("UPPER:ABC")));
    expect(eq(ctx.state().get_or<std::string>("router.route", ""), std::string("upper")));
    expect(eq(r->execute("echo:abc", ctx), std::string("echo:abc")));
  };

  "unknown_key_uses_default"_test = [&] {
    auto    r = route_by<std::string, std::string>(by_prefix, routes(),
                                                    router_options{.default_route = "echo"});
    context ctx;
    expect(eq(r->execute("other:abc", ctx), std::string("other:abc")));
    expect(eq(ctx.state().get_or<std::string>("router.route", ""), std::string("echo")));
  };

  "unknown_key_without_default_fails"_test = [&] {
    auto    r = route_by<std::string, std::string>(by_prefix, routes());
    context ctx;
    expect(throws<routing_error>([&] { r->execute("other:abc", ctx); }));
  };

  "selector_can_read_the_context"_test = [&] {
    route_fn<std::string> by_tenant = [](const std::string&, const context& ctx) -> std::string {
      return ctx.baggage().contains("vip") ? "upper" : "echo";
    };
    auto r = route_by<std::string, std::string>(by_tenant, routes());

    context vip;
    vip.baggage()["vip"] = "1";
    context regular;
    expect(eq(r->execute("hi", vip), std::string("HI")));
    expect(eq(r->execute("hi", regular), std::string("hi")));
  };

  "route_names_are_listed"_test = [&] {
    router<std::string, std::string> r(by_prefix, routes());
    expect(r.route_names() == std::vector<std::string>{"echo", "upper"});
  };

  "invalid_configuration_is_rejected"_test = [&] {
    expect(throws<configuration_error>(
        [&] { route_by<std::string, std::string>(by_prefix, {}); }));
    expect(throws<configuration_error>([&] {
      route_by<std::string, std::string>(by_prefix, routes(),
                                         router_options{.default_route = "missing"});
    }));
    expect(throws<configuration_error>(
        [&] { route_by<std::string, std::string>(route_fn<std::string>{}, routes()); }));
  };

  return 0;
}
