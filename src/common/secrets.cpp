#include "crelay/common/secrets.h"
#include "crelay/common/exceptions.h"
#include "crelay/common/logger.h"
#include <yaml-cpp/yaml.h>
#include <cstdlib>

namespace crelay {

void SecretStore::loadFile(const std::string& path) {
    if (path.empty()) {
        return;
    }
    
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigException("Failed to load secrets file " + path + ": " + e.what());
    }
    
    if (!root.IsMap()) {
        throw ConfigException("Secrets file " + path + " must contain a mapping");
    }
    
    for (const auto& entry : root) {
        if (!entry.second.IsScalar()) {
            continue;
        }
        values_[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
    CRELAY_INFO("Secrets loaded from: %s (%zu entries)", path.c_str(), values_.size());
}

void SecretStore::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

bool SecretStore::get(const std::string& key, std::string& value) const {
    const char* env = std::getenv(key.c_str());
    if (env != nullptr && env[0] != '\0') {
        value = env;
        return true;
    }
    
    auto it = values_.find(key);
    if (it != values_.end() && !it->second.empty()) {
        value = it->second;
        return true;
    }
    return false;
}

Credentials SecretStore::requireCredentials() const {
    Credentials credentials;
    std::vector<std::string> missing;
    
    if (!get(ACCESS_KEY_ID, credentials.accessKeyId)) {
        missing.push_back(ACCESS_KEY_ID);
    }
    if (!get(SECRET_ACCESS_KEY, credentials.secretAccessKey)) {
        missing.push_back(SECRET_ACCESS_KEY);
    }
    if (!get(ENDPOINT_URL, credentials.endpointUrl)) {
        missing.push_back(ENDPOINT_URL);
    }
    
    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            if (!names.empty()) {
                names += ", ";
            }
            names += name;
        }
        throw ConfigException("Missing required secrets: " + names);
    }
    return credentials;
}

}  // namespace crelay
