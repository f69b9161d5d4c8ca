#include <depwatch/config.hpp>
#include <depwatch/engine.hpp>
#include <depwatch/go/go_validator.hpp>
#include <depwatch/go/listers.hpp>
#include <depwatch/log.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace depwatch;

static void usage() {
    std::cerr << "Usage: depwatch-owners <root> <file> [entry-handle] [--event e] [--tree] [--verbose]\n"
              << "  without entry-handle: list entry points whose build includes <file>\n"
              << "  with entry-handle:    print whether that entry's build includes <file>\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    std::string event_name = "write";
    bool verbose = false;
    bool tree = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--event" && i + 1 < argc) {
            event_name = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--tree") {
            tree = true;
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() < 2 || positional.size() > 3) {
        usage();
        return 1;
    }

    auto cfg = Config::discover(positional[0]);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply_logging();
    if (verbose) log::set_level(log::Debug);

    auto event = parse_file_event(event_name);
    if (event.is_err()) {
        std::cerr << event.error().format() << "\n";
        return 1;
    }

    auto lister = go::make_unit_lister(cfg.value().scan);
    if (lister.is_err()) {
        std::cerr << lister.error().format() << "\n";
        return 1;
    }
    Engine engine(positional[0], std::move(lister).value(), cfg.value().engine_options());

    const std::string& file = positional[1];
    go::GoContentValidator validator;
    auto processable = validator.is_processable(file);
    if (processable.is_err()) {
        // Removed files cannot be read; the event still has to be applied.
        log::debug("%s", processable.error().message.c_str());
    } else if (!processable.value()) {
        std::cout << file << ": incomplete, skipped\n";
        return 0;
    }

    if (positional.size() == 3) {
        auto owned = engine.owned_by(positional[2], file, event.value());
        if (owned.is_err()) {
            std::cerr << owned.error().format() << "\n";
            return 1;
        }
        std::cout << (owned.value() ? "owned" : "not owned") << "\n";
        return owned.value() ? 0 : 2;
    }

    auto owners = engine.entries_owning(file);
    if (owners.is_err()) {
        std::cerr << owners.error().format() << "\n";
        return 1;
    }
    for (const auto& entry : owners.value()) {
        std::cout << entry << "\n";
        if (tree) std::cout << engine.graph().tree_display(entry);
    }
    return 0;
}
