#include <yview/config.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace yview {

namespace {

const char* DEFAULT_CONFIG = R"(
view:
  scroll-policy: none
  scrollbar:
    policy: as-needed
  border: none
list:
  direction: top-to-bottom
tree:
  guide-style: unicode
  indent-width: 0
  leaf-indicator: ""
input:
  bindings: standard
  mouse-scroll-step: 3
)";

// Every key that can be overridden from the environment
const std::vector<std::string>& knownKeys() {
    static const std::vector<std::string> keys = {
        Config::KEY_SCROLL_POLICY,
        Config::KEY_HIGHLIGHT_SYMBOL,
        Config::KEY_HIGHLIGHT_STYLE,
        Config::KEY_SCROLLBAR_POLICY,
        Config::KEY_SCROLLBAR_THUMB_COLOR,
        Config::KEY_SCROLLBAR_TRACK_COLOR,
        Config::KEY_TITLE,
        Config::KEY_BORDER,
        Config::KEY_LIST_DIRECTION,
        Config::KEY_GUIDE_STYLE,
        Config::KEY_INDENT_WIDTH,
        Config::KEY_LEAF_INDICATOR,
        Config::KEY_BINDINGS,
        Config::KEY_MOUSE_SCROLL_STEP,
    };
    return keys;
}

// Split a slash-separated path into components
std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Recursive lookup; rebinding a YAML::Node in a loop would write into the tree
YAML::Node findNode(const YAML::Node& node, const std::vector<std::string>& parts, size_t i) {
    if (i == parts.size()) {
        return node;
    }
    if (!node.IsMap()) {
        return YAML::Node();
    }
    const YAML::Node child = node[parts[i]];
    if (!child) {
        return YAML::Node();
    }
    return findNode(child, parts, i + 1);
}

void assignNode(YAML::Node node, const std::vector<std::string>& parts, size_t i,
                const YAML::Node& value) {
    if (i + 1 == parts.size()) {
        node[parts[i]] = value;
        return;
    }
    if (!node[parts[i]].IsMap()) {
        node[parts[i]] = YAML::Node(YAML::NodeType::Map);
    }
    assignNode(node[parts[i]], parts, i + 1, value);
}

} // namespace

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    loadDefaults();

    if (!_configPath.empty()) {
        if (auto res = loadFile(_configPath); !res) {
            return Err<void>("Failed to load config file " + _configPath, res);
        }
        yinfo("Loaded config from: {}", _configPath);
    } else {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
            } else {
                yinfo("Loaded config from: {}", xdgPath.string());
            }
        }
    }

    applyEnvOverrides();

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        try {
            mergeNodes(_config, _cmdOverrides);
        } catch (const YAML::Exception& e) {
            return Err<void>("Invalid command line overrides: " + std::string(e.what()),
                             ErrorCode::Parse);
        }
    }
    return Ok();
}

void Config::loadDefaults() {
    _config = YAML::Load(DEFAULT_CONFIG);
}

Result<void> Config::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<void>("Cannot open config file: " + path, ErrorCode::Io);
    }
    try {
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && !fileConfig.IsNull()) {
            if (!fileConfig.IsMap()) {
                return Err<void>("Config root must be a mapping: " + path, ErrorCode::Parse);
            }
            mergeNodes(_config, fileConfig);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()), ErrorCode::Parse);
    }
}

void Config::applyEnvOverrides() {
    for (const auto& key : knownKeys()) {
        std::string envVar = pathToEnvVar(key);
        const char* val = std::getenv(envVar.c_str());
        if (val) {
            setNode(key, YAML::Node(std::string(val)));
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) {
        return _config;
    }
    return findNode(_config, parts, 0);
}

void Config::setNode(const std::string& path, const YAML::Node& value) {
    auto parts = splitPath(path);
    if (parts.empty()) {
        return;
    }
    assignNode(_config, parts, 0, value);
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (const auto& it : source) {
        auto key = it.first.as<std::string>();
        const YAML::Node& value = it.second;
        if (value.IsMap() && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-' || c == '.') {
            envVar += '_';
        } else {
            envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "yview" / "config.yaml";
}

} // namespace yview
