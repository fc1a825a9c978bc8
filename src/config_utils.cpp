#include "config_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace {

bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // Scalars are kept verbatim; option parsing interprets them.
    out = node.Scalar();
    return true;
}

bool to_string_value(const nlohmann::json& v, std::string& out) {
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

bool store_yaml_value(const std::string& key, const YAML::Node& node,
                      std::map<std::string, std::string>& opts, std::string& error) {
    std::string s;
    if (!to_string_value(node, s)) {
        error = "Unsupported value for key '" + key + "'";
        return false;
    }
    opts["--" + key] = s;
    return true;
}

bool store_json_value(const std::string& key, const nlohmann::json& node,
                      std::map<std::string, std::string>& opts, std::string& error) {
    std::string s;
    if (!to_string_value(node, s)) {
        error = "Unsupported value for key '" + key + "'";
        return false;
    }
    opts["--" + key] = s;
    return true;
}

} // namespace

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (!node.IsMap()) {
                if (!store_yaml_value(key_name, node, opts, error))
                    return false;
                continue;
            }
            for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                if (!it2->first.IsScalar())
                    continue;
                if (!store_yaml_value(it2->first.as<std::string>(), it2->second, opts, error))
                    return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
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
        for (auto it = root.begin(); it != root.end(); ++it) {
            const nlohmann::json& node = it.value();
            if (!node.is_object()) {
                if (!store_json_value(it.key(), node, opts, error))
                    return false;
                continue;
            }
            for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                if (!store_json_value(it2.key(), it2.value(), opts, error))
                    return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}
