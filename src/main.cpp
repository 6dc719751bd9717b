#include "ydispatch/ydispatch.hpp"
#include <filesystem>
#include <iostream>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    std::filesystem::path config_file;
    std::string event_name = "TestEvent";
    std::string ns;
    std::string comment = "Hello World!";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            }
        } else if (arg == "-e" || arg == "--event") {
            if (i + 1 < argc) {
                event_name = argv[++i];
            }
        } else if (arg == "-n" || arg == "--namespace") {
            if (i + 1 < argc) {
                ns = argv[++i];
            }
        } else if (arg == "-m" || arg == "--message") {
            if (i + 1 < argc) {
                comment = argv[++i];
            }
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: ydispatch-cli [options]\n"
                      << "Options:\n"
                      << "  -c, --config <file>      YAML config (dispatcher/logging sections)\n"
                      << "  -e, --event <name>       Event name to dispatch (default: TestEvent)\n"
                      << "  -n, --namespace <ns>     Target namespace (default: from config)\n"
                      << "  -m, --message <text>     Payload comment (default: Hello World!)\n"
                      << "  -h, --help               Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return 1;
        }
    }

    ydispatch::Config config;
    if (!config_file.empty()) {
        auto config_res = ydispatch::Config::load_file(config_file);
        if (!config_res) {
            std::cerr << "Failed to load config: " << ydispatch::error_msg(config_res) << std::endl;
            return 1;
        }
        config = *config_res;
    }
    ydispatch::configure_logging(config);
    spdlog::info("ydispatch-cli starting");

    if (ns.empty()) {
        ns = config.default_namespace;
    }

    auto disp_res = ydispatch::Dispatcher::create(config);
    if (!disp_res) {
        std::cerr << "Failed to create dispatcher: " << ydispatch::error_msg(disp_res) << std::endl;
        return 1;
    }
    auto dispatcher = *disp_res;

    auto event_res = ydispatch::Event::create(event_name, {{"comment", comment}});
    if (!event_res) {
        std::cerr << "Failed to create event: " << ydispatch::error_msg(event_res) << std::endl;
        return 1;
    }
    auto event = *event_res;
    spdlog::info("Event created: {}", event->to_string());

    auto handler_res = ydispatch::Handler::from("echo", [](const ydispatch::Event& ev) {
        return ev.data().get_as<std::string>("comment").value_or("");
    });
    if (!handler_res) {
        std::cerr << "Failed to create handler: " << ydispatch::error_msg(handler_res) << std::endl;
        return 1;
    }

    auto code_res = dispatcher->subscribe(*event, *handler_res, ns, true);
    if (!code_res) {
        std::cerr << "Subscribe failed: " << ydispatch::error_msg(code_res) << std::endl;
        return 1;
    }
    spdlog::info("Subscribed '{}' with code {}", handler_res->name(), *code_res);

    auto note_res = dispatcher->dispatch(event, ns);
    if (!note_res) {
        std::cerr << "Dispatch failed: " << ydispatch::error_msg(note_res) << std::endl;
        return 1;
    }
    auto notification = *note_res;
    std::cout << notification->to_string() << std::endl;

    if (auto res = dispatcher->unsubscribe_by_code(*code_res); !res) {
        std::cerr << "Unsubscribe failed: " << ydispatch::error_msg(res) << std::endl;
        return 1;
    }

    return notification->has_errors() ? 2 : 0;
}
