#include <yview/config.h>
#include <yview/document.h>
#include <yview/grid-surface.h>
#include <yview/key-bindings.h>
#include <yview/list-view.h>
#include <yview/tree-view.h>
#include <yview/view-options.h>

#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <ytrace/ytrace.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifdef __unix__
#include <sys/ioctl.h>
#include <unistd.h>
#endif

using namespace yview;

// ──────────────────────────────────────────────────────────────────────────────
// Helpers
// ──────────────────────────────────────────────────────────────────────────────

static int terminalColumns() {
#ifdef __unix__
    struct winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
#endif
    return 80;
}

static Result<std::vector<KeyEvent>> parseKeyScript(const std::string& script) {
    std::vector<KeyEvent> keys;
    std::istringstream ss(script);
    std::string name;
    while (std::getline(ss, name, ',')) {
        if (name.empty()) continue;
        auto key = parseKeyName(name);
        if (!key) {
            return Err<std::vector<KeyEvent>>("invalid key script", key);
        }
        keys.push_back(*key);
    }
    return keys;
}

// Replays keys with a layout pass after each one so the scroll policy sees
// every intermediate selection, then draws the final frame.
template<typename View, typename RenderFn>
static void runView(View& view, const std::vector<KeyEvent>& keys, const Rect& area,
                    GridSurface& surface, const RenderFn& layoutOnly) {
    layoutOnly();
    for (const auto& key : keys) {
        if (!view.handleKey(key)) {
            ydebug("yview: key not bound");
        }
        layoutOnly();
    }
    view.render(area, surface);
}

// ──────────────────────────────────────────────────────────────────────────────
// main
// ──────────────────────────────────────────────────────────────────────────────

int main(int argc, const char** argv) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    args::ArgumentParser parser("yview", "Render a YAML list or tree document as a scrollable view.");
    parser.Prog("yview");

    args::Flag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "path",
        "Config file (default: $XDG_CONFIG_HOME/yview/config.yaml)", {'c', "config"});
    args::ValueFlag<int> widthFlag(parser, "cols",
        "View width in columns (default: terminal width)", {'W', "width"});
    args::ValueFlag<int> heightFlag(parser, "rows",
        "View height in rows", {'H', "height"}, 10);
    args::ValueFlag<std::string> keysFlag(parser, "keys",
        "Comma separated keys to replay, e.g. down,down,pgdn,enter", {'k', "keys"});
    args::ValueFlag<std::string> policyFlag(parser, "policy",
        "Scroll policy: none, auto-scroll, scroll-to-end, sticky-scroll", {"policy"});
    args::ValueFlag<std::string> bindingsFlag(parser, "preset",
        "Key bindings: standard, vim", {"bindings"});
    args::Flag treeFlag(parser, "tree", "Treat the document as a tree", {'t', "tree"});
    args::Flag bottomFlag(parser, "bottom-to-top", "Stack list items upwards from the bottom",
                          {"bottom-to-top"});

    args::Positional<std::string> file(parser, "file", "YAML document to display");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    if (helpFlag) {
        std::cout << parser;
        return 0;
    }
    if (!file) {
        std::cerr << "yview: missing document\n";
        std::cerr << parser;
        return 1;
    }

    YAML::Node overrides;
    if (policyFlag) {
        overrides["view"]["scroll-policy"] = args::get(policyFlag);
    }
    if (bindingsFlag) {
        overrides["input"]["bindings"] = args::get(bindingsFlag);
    }
    if (bottomFlag) {
        overrides["list"]["direction"] = toString(ListDirection::BottomToTop);
    }

    auto config = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!config) {
        std::cerr << "yview: " << error_msg(config) << "\n";
        return 1;
    }
    auto options = ViewOptions::fromConfig(**config);
    if (!options) {
        std::cerr << "yview: " << error_msg(options) << "\n";
        return 1;
    }

    std::vector<KeyEvent> keys;
    if (keysFlag) {
        auto parsed = parseKeyScript(args::get(keysFlag));
        if (!parsed) {
            std::cerr << "yview: " << error_msg(parsed) << "\n";
            return 1;
        }
        keys = std::move(*parsed);
    }

    auto text = loadDocumentFile(args::get(file));
    if (!text) {
        std::cerr << "yview: " << error_msg(text) << "\n";
        return 1;
    }

    int width = widthFlag ? args::get(widthFlag) : terminalColumns();
    int height = args::get(heightFlag);
    if (width <= 0 || height <= 0) {
        std::cerr << "yview: width and height must be positive\n";
        return 1;
    }

    Rect area{0, 0, width, height};
    GridSurface surface(width, height);

    if (treeFlag) {
        auto roots = parseTreeDocument(*text);
        if (!roots) {
            std::cerr << "yview: " << error_msg(roots) << "\n";
            return 1;
        }
        TreeView view(std::move(*roots));
        if (auto res = options->applyTo(view); !res) {
            std::cerr << "yview: " << error_msg(res) << "\n";
            return 1;
        }
        runView(view, keys, area, surface, [&] { view.render(area, RenderNodeFn{}); });
    } else {
        auto items = parseListDocument(*text);
        if (!items) {
            std::cerr << "yview: " << error_msg(items) << "\n";
            return 1;
        }
        ListView view(std::move(*items));
        if (auto res = options->applyTo(view); !res) {
            std::cerr << "yview: " << error_msg(res) << "\n";
            return 1;
        }
        runView(view, keys, area, surface, [&] { view.render(area, RenderItemFn{}); });
    }

    std::cout << surface.toString() << "\n";
    return 0;
}
