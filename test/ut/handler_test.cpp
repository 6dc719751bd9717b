// Handler unit tests
#include <boost/ut.hpp>
#include "ydispatch/handler.hpp"
#include "ydispatch/event.hpp"
#include "harness/fakes.hpp"
#include <stdexcept>

using namespace boost::ut;
using namespace ydispatch;

suite handler_tests = [] {
    "handler_create_rejects_empty_callable"_test = [] {
        auto res = Handler::create("nothing", Handler::Callback{});
        expect(!res.has_value());
        expect(error_kind(res) == ErrorKind::InvalidHandler);
    };

    "default_handler_is_invalid"_test = [] {
        Handler h;
        expect(!h.valid());

        auto ev = test::make_event("x");
        auto res = h(*ev, Args{});
        expect(!res.has_value());
        expect(error_kind(res) == ErrorKind::InvalidHandler);
    };

    "handler_from_adapts_return_types"_test = [] {
        auto ev = test::make_event("x", {{"name", std::string("Alice")}});

        auto greet = Handler::from("greet", [](const Event& e) {
            return "Hello, " + e.data().get_as<std::string>("name").value_or("?") + "!";
        });
        expect(greet.has_value());
        auto r1 = (*greet)(*ev, Args{});
        expect(r1.has_value());
        expect(get_as<std::string>(*r1) == std::optional<std::string>("Hello, Alice!"));

        int calls = 0;
        auto side = Handler::from("side", [&calls](const Event&) { ++calls; });
        expect(side.has_value());
        auto r2 = (*side)(*ev, Args{});
        expect(r2.has_value());
        expect(!r2->has_value()) << "void handlers yield an empty value";
        expect(calls == 1_i);

        auto failing = Handler::from("failing", [](const Event&) -> Result<Value> {
            return Err<Value>("nope");
        });
        expect(failing.has_value());
        auto r3 = (*failing)(*ev, Args{});
        expect(!r3.has_value());
        expect(r3.error().message() == "nope");
    };

    "handler_receives_extra_args"_test = [] {
        auto ev = test::make_event("x");
        auto sum = Handler::from("sum", [](const Event&, const Args& args) {
            int total = 0;
            for (const auto& v : args.positional) {
                total += get_as<int>(v).value_or(0);
            }
            return total * args.kw<int>("scale").value_or(1);
        });
        expect(sum.has_value());

        Args args{{1, 2, 3}, {{"scale", 10}}};
        auto r = (*sum)(*ev, args);
        expect(r.has_value());
        expect(get_as<int>(*r) == std::optional<int>(60));
    };

    "handler_exceptions_propagate_to_caller"_test = [] {
        auto ev = test::make_event("x");
        auto boom = Handler::from("boom", [](const Event&) -> int { throw std::runtime_error("kaboom"); });
        expect(boom.has_value());
        expect(throws([&] { (void)(*boom)(*ev, Args{}); }));
    };

    "handler_identity_follows_copies"_test = [] {
        auto fn = [](const Event&) { return 1; };
        auto a = Handler::from("same", fn);
        auto b = Handler::from("same", fn);
        expect(a.has_value() && b.has_value());

        Handler copy = *a;
        expect(copy == *a);
        expect(copy.identity() == a->identity());
        expect(!(*a == *b)) << "separately created handlers are distinct";
    };

    "handler_without_name_is_anonymous"_test = [] {
        auto h = Handler::from("", [](const Event&) { return 0; });
        expect(h.has_value());
        expect(h->name() == std::string(Handler::ANONYMOUS));
    };
};
