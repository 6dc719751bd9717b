// Event and EventData unit tests
#include <boost/ut.hpp>
#include "ydispatch/event.hpp"
#include "harness/fakes.hpp"

using namespace boost::ut;
using namespace ydispatch;

suite event_tests = [] {
    "event_create_assigns_identity"_test = [] {
        auto ev_res = Event::create("greeting_event", {{"name", std::string("Alice")}});
        expect(ev_res.has_value()) << "Event creation failed: " << error_msg(ev_res);
        auto ev = *ev_res;

        expect(ev->name() == "greeting_event");
        expect(ev->code() == "greeting_event");
        expect(ev->uuid().size() == 36_ul) << "uuid should be 36 chars, got " << ev->uuid();
        expect(ev->data().get_as<std::string>("name") == std::optional<std::string>("Alice"));
    };

    "event_ids_are_unique"_test = [] {
        auto a = test::make_event("a");
        auto b = test::make_event("a");
        expect(a != nullptr && b != nullptr);

        expect(a->id() != b->id());
        expect(a->uuid() != b->uuid());
        expect(!(*a == *b)) << "distinct events must not compare equal";
        expect(a->compare_to(*b) < 0);
        expect(b->compare_to(*a) > 0);
        expect(a->compare_to(*a) == 0);
    };

    "event_code_derived_from_name"_test = [] {
        expect(Event::code_from_name("Test Event") == "test_event");
        expect(Event::code_from_name("  user.logged-in ") == "user_logged_in");
        expect(Event::code_from_name("TestEvent") == "testevent");
        expect(Event::code_from_name("!!!").empty());
    };

    "event_explicit_code_wins"_test = [] {
        auto ev_res = Event::create("Order Placed", {}, "order.placed");
        expect(ev_res.has_value());
        expect((*ev_res)->code() == "order.placed");
        expect((*ev_res)->name() == "Order Placed");
    };

    "event_create_rejects_unnamed"_test = [] {
        auto ev_res = Event::create("");
        expect(!ev_res.has_value());
        expect(error_kind(ev_res) == ErrorKind::Configuration);
    };

    "event_data_get_set_clear"_test = [] {
        auto ev = test::make_event("payload");
        expect(ev->is_empty());

        ev->set("count", 3);
        ev->data().set("who", std::string("bob"));

        expect(ev->contains("count"));
        expect(!ev->contains("missing"));
        expect(ev->data().size() == 2_ul);
        expect(ev->data().get_as<int>("count") == std::optional<int>(3));
        expect(!ev->data().get_as<std::string>("count").has_value()) << "wrong type must not convert";
        expect(!ev->get("missing").has_value());

        expect(ev->data().erase("who"));
        expect(!ev->data().erase("who"));

        ev->clear();
        expect(ev->is_empty());
    };

    "event_data_keys_sorted"_test = [] {
        auto ev = test::make_event("keys", {{"b", 2}, {"a", 1}});
        auto keys = ev->data().keys();
        expect(keys.size() == 2_ul);
        expect(keys[0] == "a");
        expect(keys[1] == "b");
    };

    "event_last_notified_initially_empty"_test = [] {
        auto ev = test::make_event("fresh");
        expect(!ev->last_notified().has_value());

        auto when = Clock::time_point{} + std::chrono::seconds(7);
        ev->set_last_notified(when);
        expect(ev->last_notified() == std::optional<Clock::time_point>(when));
    };

    "event_to_string_mentions_code"_test = [] {
        auto ev = test::make_event("Print Me", {{"k", std::string("v")}});
        auto s = ev->to_string();
        expect(s.find("print_me") != std::string::npos) << s;
        expect(s.find("k: \"v\"") != std::string::npos) << s;
    };
};
