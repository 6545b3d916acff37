#pragma once

#include <yview/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace yview {

//=============================================================================
// Config - layered yaml-cpp configuration
//
// Sources, later ones winning: built-in defaults, config file (explicit
// path, else $XDG_CONFIG_HOME/yview/config.yaml when present), YVIEW_*
// environment variables, command line overrides.
//=============================================================================
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by slash path (e.g. "view/scrollbar/policy");
    // nullopt if missing or not convertible
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    static std::filesystem::path getXDGConfigPath();

    // "view/scroll-policy" -> "YVIEW_VIEW_SCROLL_POLICY"
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "YVIEW_";

    static constexpr const char* KEY_SCROLL_POLICY = "view/scroll-policy";
    static constexpr const char* KEY_HIGHLIGHT_SYMBOL = "view/highlight-symbol";
    static constexpr const char* KEY_HIGHLIGHT_STYLE = "view/highlight-style";
    static constexpr const char* KEY_SCROLLBAR_POLICY = "view/scrollbar/policy";
    static constexpr const char* KEY_SCROLLBAR_THUMB_COLOR = "view/scrollbar/thumb-color";
    static constexpr const char* KEY_SCROLLBAR_TRACK_COLOR = "view/scrollbar/track-color";
    static constexpr const char* KEY_TITLE = "view/title";
    static constexpr const char* KEY_BORDER = "view/border";
    static constexpr const char* KEY_LIST_DIRECTION = "list/direction";
    static constexpr const char* KEY_GUIDE_STYLE = "tree/guide-style";
    static constexpr const char* KEY_INDENT_WIDTH = "tree/indent-width";
    static constexpr const char* KEY_LEAF_INDICATOR = "tree/leaf-indicator";
    static constexpr const char* KEY_BINDINGS = "input/bindings";
    static constexpr const char* KEY_MOUSE_SCROLL_STEP = "input/mouse-scroll-step";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides();

    YAML::Node getNode(const std::string& path) const;
    void setNode(const std::string& path, const YAML::Node& value);

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

// Template implementations
template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace yview
