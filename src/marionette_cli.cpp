// =============================================================================
// Marionette - command line driver
// =============================================================================
// marionette_cli <config.json> <hwnd> <command> [args...]
//   classify              print the window category
//   resolve               print the automation target
//   click x y [button]    click at client coordinates
//   key <name>            tap a key (name, alias or VK number)
//   text <string>         type UTF-8 text
// hwnd accepts decimal or 0x-prefixed hex.
// =============================================================================
#include <cstdio>
#include <cstdlib>
#include <string>

#include "config_loader.hpp"
#include "event_bus.hpp"
#include "ldplayer_console.hpp"
#include "marionette_log.hpp"
#include "mumu_manager.hpp"
#include "process_runner.hpp"
#include "remote_shell.hpp"
#include "simulator_registry.hpp"
#include "target_resolver.hpp"
#include "text_input_engine.hpp"
#include "win32_window_system.hpp"
#include "window_classifier.hpp"
#include "window_index_table.hpp"

using namespace marionette;

namespace {

void usage() {
    std::fprintf(stderr,
        "usage: marionette_cli <config.json> <hwnd> <command> [args]\n"
        "  classify | resolve | click x y [button] | key <name> | text <string>\n");
}

bool parseHandle(const char* s, WindowHandle& out) {
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 0);
    if (!end || *end != '\0' || v == 0) return false;
    out = static_cast<WindowHandle>(v);
    return true;
}

bool parseInt(const char* s, int& out) {
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (!end || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}

KeySpec keySpecFrom(const std::string& arg) {
    int code = 0;
    if (arg.size() > 1 && parseInt(arg.c_str(), code)) return code;
    return arg;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        usage();
        return 2;
    }

    auto cfg = config::loadConfig(argv[1], true);
    marionette::log::setLogLevel(marionette::log::levelFromString(cfg.log.level));
    if (!cfg.log.log_path.empty() && !marionette::log::openLogFile(cfg.log.log_path.c_str())) {
        MNLOG_WARN("cli", "cannot open log file %s", cfg.log.log_path.c_str());
    }

    WindowHandle hwnd = 0;
    if (!parseHandle(argv[2], hwnd)) {
        std::fprintf(stderr, "invalid window handle: %s\n", argv[2]);
        return 2;
    }
    const std::string command = argv[3];

    Win32WindowSystem ws;
    SendInputInjector injector;
    HiddenProcessRunner runner;
    EventBus bus;

    MuMuManager mumu(runner, cfg.mumu);
    LdPlayerConsole ldconsole(runner, cfg.ldplayer);
    WindowClassifier classifier(ws);
    TargetResolver resolver(ws, &ldconsole, &mumu, &bus);
    WindowIndexTable index_table(std::vector<WindowHandle>(cfg.text_input.bound_windows.begin(),
                                                           cfg.text_input.bound_windows.end()));

    AdbShell ld_shell(runner, cfg.adb, [&ldconsole]() {
        std::vector<std::string> serials;
        for (const auto& inst : ldconsole.instances()) {
            serials.push_back(LdPlayerConsole::adb_serial(inst.index));
        }
        return serials;
    });
    MuMuShell mumu_shell(mumu, mumu);
    TextInputEngine ld_text(ld_shell, cfg.text_input, &bus);
    TextInputEngine mumu_text(mumu_shell, cfg.text_input, &bus);

    SimulatorRegistry::Dependencies deps;
    deps.window_system = &ws;
    deps.injector = &injector;
    deps.classifier = &classifier;
    deps.resolver = &resolver;
    deps.family_b_bridge = &mumu;
    deps.family_a_directory = &ldconsole;
    deps.family_a_text = &ld_text;
    deps.family_b_text = &mumu_text;
    deps.index_table = &index_table;
    deps.bus = &bus;
    deps.input = cfg.input;
    if (auto mode = parseTextInputMode(cfg.text_input.mode)) {
        deps.text_mode = *mode;
    } else {
        MNLOG_WARN("cli", "unknown text mode '%s', using broadcast_all", cfg.text_input.mode.c_str());
    }
    SimulatorRegistry registry(deps);

    int rc = 0;
    if (command == "classify") {
        std::printf("%s\n", windowCategoryName(classifier.classify(hwnd)));
    } else if (command == "resolve") {
        auto category = classifier.classify(hwnd);
        auto target = resolver.resolve(hwnd, category);
        std::printf("%s %s\n", windowCategoryName(category),
                    target ? target->describe().c_str() : "(raw handle)");
    } else {
        auto sim = registry.get_simulator(hwnd);
        if (!sim) {
            std::fprintf(stderr, "no simulator available for %s\n", argv[2]);
            return 1;
        }

        bool ok = false;
        if (command == "click" && argc >= 6) {
            int x = 0, y = 0;
            if (!parseInt(argv[4], x) || !parseInt(argv[5], y)) {
                usage();
                return 2;
            }
            ok = sim->click(x, y, argc >= 7 ? argv[6] : "left");
        } else if (command == "key" && argc >= 5) {
            ok = sim->send_key(keySpecFrom(argv[4]));
        } else if (command == "text" && argc >= 5) {
            ok = sim->send_text(argv[4]);
        } else {
            usage();
            return 2;
        }
        std::printf("%s via %s: %s\n", command.c_str(), sim->kind(), ok ? "ok" : "failed");
        rc = ok ? 0 : 1;
    }

    marionette::log::closeLogFile();
    return rc;
}
