#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace sigil::config {

class ConfigPaths {
public:
    static constexpr const char* DEFAULT_CONFIG_FILE = "config/sigil.yaml";
};

enum class ConfigFormat { YAML, JSON, INI };

// Strongly typed view over one section of the configuration tree
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;
    virtual bool supports_hot_reload() const { return false; }
    virtual std::unique_ptr<ConfigurationProperties> clone() const = 0;

protected:
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }

    template <typename T>
    void load_vector(const boost::property_tree::ptree& pt,
                     const std::string& path, std::vector<T>& vec) {
        vec.clear();
        if (auto child_pt = pt.get_child_optional(path)) {
            for (const auto& v : *child_pt) {
                vec.push_back(v.second.get_value<T>());
            }
        }
    }
};

template <typename Derived>
class ClonableConfigurationProperties : public ConfigurationProperties {
public:
    std::unique_ptr<ConfigurationProperties> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }
};

template <typename Derived>
class ReloadableConfigurationProperties
    : public ClonableConfigurationProperties<Derived> {
public:
    bool supports_hot_reload() const override { return true; }
};

class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    void load_config(const std::string& config_file,
                     ConfigFormat format = ConfigFormat::YAML);
    void load_config_from_string(const std::string& content,
                                 ConfigFormat format = ConfigFormat::YAML);

    // Re-reads the file and swaps in validated copies of every reloadable
    // section. Returns false and keeps the active values on any failure.
    bool reload_config(const std::string& config_file,
                       ConfigFormat format = ConfigFormat::YAML);

    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> config) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        std::lock_guard<std::mutex> lock(config_mutex_);
        configs_[std::type_index(typeid(T))] = config;
        config_by_name_[config->properties_name()] = config;
    }

    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        std::lock_guard<std::mutex> lock(config_mutex_);
        auto it = configs_.find(std::type_index(typeid(T)));
        if (it != configs_.end()) {
            return std::static_pointer_cast<T>(it->second);
        }
        return nullptr;
    }

    void reset() {
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            configs_.clear();
            config_by_name_.clear();
            config_tree_ = boost::property_tree::ptree();
        }
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        reload_subscribers_.clear();
    }

    const boost::property_tree::ptree& get_config_tree() const {
        return config_tree_;
    }

    // The callback runs after a successful reload, outside the config lock.
    template <typename ConfigType>
    void subscribe_to_reloads(
        std::function<void(const ConfigType& new_config)> callback) {
        static_assert(
            std::is_base_of_v<ReloadableConfigurationProperties<ConfigType>,
                              ConfigType>,
            "Can only subscribe to types derived from "
            "ReloadableConfigurationProperties");

        ReloadCallback generic_callback =
            [cb = std::move(callback)](const ConfigurationProperties& config) {
                cb(static_cast<const ConfigType&>(config));
            };

        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        reload_subscribers_[std::type_index(typeid(ConfigType))].push_back(
            std::move(generic_callback));
    }

private:
    ConfigManager() = default;

    using ReloadCallback =
        std::function<void(const ConfigurationProperties& new_config)>;

    mutable std::mutex config_mutex_;
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        configs_;
    std::unordered_map<std::string, std::shared_ptr<ConfigurationProperties>>
        config_by_name_;
    boost::property_tree::ptree config_tree_;

    std::mutex subscribers_mutex_;
    std::unordered_map<std::type_index, std::vector<ReloadCallback>>
        reload_subscribers_;

    void load_component_configs();
    boost::property_tree::ptree parse_file(const std::string& config_file,
                                           ConfigFormat format);
    boost::property_tree::ptree parse_string(const std::string& content,
                                             ConfigFormat format);
    boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);
};

template <typename T>
class ConfigurationPropertiesFactory {
public:
    static std::shared_ptr<T> create_and_register() {
        auto config = std::make_shared<T>();
        ConfigManager::instance().register_configuration_properties(config);
        return config;
    }
};

}  // namespace sigil::config
