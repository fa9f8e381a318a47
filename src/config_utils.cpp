#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static bool read_yaml_value(const std::string& key, const YAML::Node& node, ConfigValues& cfg,
                            std::string& error);

static bool read_yaml_map(const YAML::Node& node, ConfigValues& cfg, std::string& error) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (!it->first.IsScalar()) {
            error = "Non-scalar key";
            return false;
        }
        const std::string key_name = it->first.as<std::string>();
        const YAML::Node& val = it->second;
        if (key_name == "repositories") {
            if (!val.IsMap()) {
                error = "'repositories' must be a map";
                return false;
            }
            for (auto r = val.begin(); r != val.end(); ++r) {
                auto& m = cfg.repo_opts[r->first.as<std::string>()];
                if (r->second.IsNull()) {
                    m.clear();
                    continue;
                }
                if (!r->second.IsMap()) {
                    error = "Repository entry must be a map: " + r->first.as<std::string>();
                    return false;
                }
                for (auto sub = r->second.begin(); sub != r->second.end(); ++sub) {
                    std::string s;
                    if (!to_string_value(sub->second, s)) {
                        error = "Invalid value for " + sub->first.as<std::string>();
                        return false;
                    }
                    m["--" + sub->first.as<std::string>()] = s;
                }
            }
            continue;
        }
        if (!read_yaml_value(key_name, val, cfg, error))
            return false;
    }
    return true;
}

static bool read_yaml_value(const std::string& key, const YAML::Node& node, ConfigValues& cfg,
                            std::string& error) {
    if (node.IsMap())
        return read_yaml_map(node, cfg, error);
    if (node.IsSequence()) {
        auto& list = cfg.list_opts["--" + key];
        for (const auto& item : node) {
            std::string s;
            if (!to_string_value(item, s)) {
                error = "Invalid list item for " + key;
                return false;
            }
            list.push_back(s);
        }
        return true;
    }
    std::string s;
    if (!to_string_value(node, s)) {
        error = "Invalid value for " + key;
        return false;
    }
    cfg.opts["--" + key] = s;
    return true;
}

bool load_yaml_config(const std::string& path, ConfigValues& cfg, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        return read_yaml_map(root, cfg, error);
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

static bool read_json_object(const nlohmann::json& obj, ConfigValues& cfg, std::string& error) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const std::string key_name = it.key();
        const auto& val = it.value();
        if (key_name == "repositories") {
            if (!val.is_object()) {
                error = "'repositories' must be an object";
                return false;
            }
            for (auto r = val.begin(); r != val.end(); ++r) {
                auto& m = cfg.repo_opts[r.key()];
                if (r.value().is_null()) {
                    m.clear();
                    continue;
                }
                if (!r.value().is_object()) {
                    error = "Repository entry must be an object: " + r.key();
                    return false;
                }
                for (auto sub = r.value().begin(); sub != r.value().end(); ++sub) {
                    std::string s;
                    if (!to_string_value(sub.value(), s)) {
                        error = "Invalid value for " + sub.key();
                        return false;
                    }
                    m["--" + sub.key()] = s;
                }
            }
        } else if (val.is_object()) {
            if (!read_json_object(val, cfg, error))
                return false;
        } else if (val.is_array()) {
            auto& list = cfg.list_opts["--" + key_name];
            for (const auto& item : val) {
                std::string s;
                if (!to_string_value(item, s)) {
                    error = "Invalid list item for " + key_name;
                    return false;
                }
                list.push_back(s);
            }
        } else {
            std::string s;
            if (!to_string_value(val, s)) {
                error = "Invalid value for " + key_name;
                return false;
            }
            cfg.opts["--" + key_name] = s;
        }
    }
    return true;
}

bool load_json_config(const std::string& path, ConfigValues& cfg, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        return read_json_object(root, cfg, error);
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}
