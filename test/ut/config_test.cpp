// Config loading tests
#include <boost/ut.hpp>
#include "ydispatch/config.hpp"
#include "ydispatch/dispatcher.hpp"
#include <filesystem>

using namespace boost::ut;
using namespace ydispatch;

suite config_tests = [] {
    "config_defaults"_test = [] {
        Config config;
        expect(config.default_namespace == "global");
        expect(config.error_log_size == 1000_ul);
        expect(config.handler_error_level == spdlog::level::warn);
        expect(config.log_level == spdlog::level::info);
    };

    "config_empty_document_keeps_defaults"_test = [] {
        auto res = Config::load_string("");
        expect(res.has_value()) << error_msg(res);
        expect(res->default_namespace == "global");
    };

    "config_load_string_reads_every_key"_test = [] {
        auto res = Config::load_string(R"(
dispatcher:
  default-namespace: orders
  error-log-size: 16
  handler-error-level: error
logging:
  level: debug
  pattern: "%v"
)");
        expect(res.has_value()) << error_msg(res);
        expect(res->default_namespace == "orders");
        expect(res->error_log_size == 16_ul);
        expect(res->handler_error_level == spdlog::level::err);
        expect(res->log_level == spdlog::level::debug);
        expect(res->log_pattern == "%v");
    };

    "config_partial_document"_test = [] {
        auto res = Config::load_string("logging:\n  level: warning\n");
        expect(res.has_value());
        expect(res->log_level == spdlog::level::warn);
        expect(res->error_log_size == 1000_ul);
    };

    "config_rejects_bad_values"_test = [] {
        auto bad_level = Config::load_string("logging:\n  level: loud\n");
        expect(error_kind(bad_level) == ErrorKind::Configuration);

        auto negative = Config::load_string("dispatcher:\n  error-log-size: -3\n");
        expect(error_kind(negative) == ErrorKind::Configuration);

        auto empty_ns = Config::load_string("dispatcher:\n  default-namespace: \"\"\n");
        expect(error_kind(empty_ns) == ErrorKind::Configuration);

        auto not_a_number = Config::load_string("dispatcher:\n  error-log-size: lots\n");
        expect(error_kind(not_a_number) == ErrorKind::Configuration);

        auto not_a_map = Config::load_string("- just\n- a list\n");
        expect(error_kind(not_a_map) == ErrorKind::Configuration);
    };

    "config_rejects_malformed_yaml"_test = [] {
        auto res = Config::load_string("dispatcher: [unclosed");
        expect(!res.has_value());
        expect(error_kind(res) == ErrorKind::Configuration);
    };

    "config_missing_file"_test = [] {
        auto path = std::filesystem::temp_directory_path() / "ydispatch-does-not-exist.yaml";
        auto res = Config::load_file(path);
        expect(!res.has_value());
        expect(error_kind(res) == ErrorKind::Configuration);
    };

    "parse_level_names"_test = [] {
        expect(parse_level("trace").value_or(spdlog::level::off) == spdlog::level::trace);
        expect(parse_level("err").value_or(spdlog::level::off) == spdlog::level::err);
        expect(parse_level("warning").value_or(spdlog::level::off) == spdlog::level::warn);
        expect(parse_level("off").value_or(spdlog::level::info) == spdlog::level::off);
        expect(!parse_level("verbose").has_value());
    };

    "dispatcher_honours_error_log_size"_test = [] {
        auto config = Config::load_string("dispatcher:\n  error-log-size: 2\n");
        expect(config.has_value());

        auto disp = *Dispatcher::create(*config);
        auto bad = Handler::from("bad", [](const Event&) -> Result<Value> { return Err<Value>("nope"); });
        expect(disp->subscribe("e", *bad).has_value());

        auto ev = Event::create("e");
        expect(ev.has_value());
        for (int i = 0; i < 5; ++i) {
            expect(disp->dispatch(*ev).has_value());
        }
        expect(disp->error_log().size() == 2_ul);
        expect(disp->error_log().max_size() == 2_ul);
    };
};
