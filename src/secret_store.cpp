// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "secret_store.h"

#include <cstdlib>

namespace recscribe {

EnvSecretStore::EnvSecretStore(std::map<std::string, std::string> config_keys)
    : config_keys_(std::move(config_keys)) {}

std::optional<std::string> EnvSecretStore::read_key(Provider provider) const {
    const auto* info = find_provider(provider);
    if (!info) return std::nullopt;

    if (const char* val = std::getenv(info->env_var); val && val[0] != '\0')
        return std::string(val);

    auto it = config_keys_.find(info->name);
    if (it != config_keys_.end() && !it->second.empty())
        return it->second;
    return std::nullopt;
}

std::optional<std::string> StaticSecretStore::read_key(Provider provider) const {
    auto it = keys_.find(provider);
    if (it == keys_.end() || it->second.empty())
        return std::nullopt;
    return it->second;
}

} // namespace recscribe
