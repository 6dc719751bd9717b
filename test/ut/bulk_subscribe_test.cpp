// bulk_subscribe tests
#include <boost/ut.hpp>
#include "ydispatch/dispatcher.hpp"
#include "harness/fakes.hpp"

using namespace boost::ut;
using namespace ydispatch;

namespace {

Handler named(const std::string& name, std::vector<std::string>& trace) {
    auto res = Handler::from(name, [&trace, name](const Event&) {
        trace.push_back(name);
        return name;
    });
    return res ? *res : Handler{};
}

} // namespace

suite bulk_subscribe_tests = [] {
    "bulk_subscribe_zips_lists"_test = [] {
        auto disp = *Dispatcher::create();
        std::vector<std::string> trace;

        BulkSubscription bulk;
        bulk.events = {"e1", "e2"};
        bulk.handlers = std::vector<Handler>{named("h1", trace), named("h2", trace)};
        bulk.priorities = std::vector<int>{0, 10};

        auto codes = disp->bulk_subscribe(bulk);
        expect(codes.has_value()) << error_msg(codes);
        expect(codes->size() == 2_ul);
        expect(disp->subscription_count() == 2_ul);

        auto second = disp->get_subscription_by_code((*codes)[1]);
        expect(second.has_value());
        expect((*second)->priority() == 10_i);
        expect((*second)->ns() == GLOBAL_NAMESPACE) << "namespace defaults to global";
        expect(!(*second)->persistent());

        expect(disp->dispatch(test::make_event("e2")).has_value());
        expect(trace == std::vector<std::string>{"h2"});
    };

    "bulk_subscribe_broadcasts_scalars"_test = [] {
        auto disp = *Dispatcher::create();
        std::vector<std::string> trace;

        BulkSubscription bulk;
        bulk.events = {"a", "b", "c"};
        bulk.handlers = named("shared", trace);
        bulk.namespaces = std::string("batch");
        bulk.persistents = true;

        auto codes = disp->bulk_subscribe(bulk);
        expect(codes.has_value());
        expect(disp->get_subscriptions_by_namespace("batch").size() == 3_ul);
        for (const auto& s : disp->get_subscriptions_by_namespace("batch")) {
            expect(s->persistent());
            expect(s->handler().name() == "shared");
        }

        expect(disp->dispatch(test::make_event("b"), "batch").has_value());
        expect(trace.size() == 1_ul);
    };

    "bulk_subscribe_length_mismatch_registers_nothing"_test = [] {
        auto disp = *Dispatcher::create();
        std::vector<std::string> trace;

        BulkSubscription bulk;
        bulk.events = {"e1", "e2", "e3"};
        bulk.handlers = std::vector<Handler>{named("h1", trace), named("h2", trace), named("h3", trace)};
        bulk.namespaces = std::vector<std::string>{"x", "y"};

        auto res = disp->bulk_subscribe(bulk);
        expect(!res.has_value());
        expect(error_kind(res) == ErrorKind::Configuration);
        expect(res.error().root_message().find("namespaces") != std::string::npos) << res.error().root_message();
        expect(disp->subscription_count() == 0_ul);
    };

    "bulk_subscribe_empty_handler_list_is_a_mismatch"_test = [] {
        auto disp = *Dispatcher::create();
        BulkSubscription bulk;
        bulk.events = {"e1"};

        auto res = disp->bulk_subscribe(bulk);
        expect(error_kind(res) == ErrorKind::Configuration);
        expect(disp->subscription_count() == 0_ul);
    };

    "bulk_subscribe_stops_at_first_invalid_item"_test = [] {
        auto disp = *Dispatcher::create();
        std::vector<std::string> trace;

        BulkSubscription bulk;
        bulk.events = {"ok", "broken", "never"};
        bulk.handlers = std::vector<Handler>{named("h0", trace), Handler{}, named("h2", trace)};

        auto res = disp->bulk_subscribe(bulk);
        expect(!res.has_value());
        expect(error_kind(res) == ErrorKind::InvalidHandler);
        expect(res.error().message().find("item 1") != std::string::npos) << res.error().message();

        // Items before the failure stay registered
        expect(disp->subscription_count() == 1_ul);
        expect(disp->get_subscriptions_by_event("ok").size() == 1_ul);
        expect(disp->get_subscriptions_by_event("never").empty());
    };

    "bulk_subscribe_with_no_events_is_a_no_op"_test = [] {
        auto disp = *Dispatcher::create();
        BulkSubscription bulk;

        auto res = disp->bulk_subscribe(bulk);
        expect(res.has_value());
        expect(res->empty());
    };
};
