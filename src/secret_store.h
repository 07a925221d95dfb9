// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "provider.h"

#include <map>
#include <optional>
#include <string>

namespace recscribe {

/// Keychain-style secret lookup. Absence is reported as std::nullopt;
/// callers turn that into ErrorKind::NoApiKey.
class SecretStore {
public:
    virtual ~SecretStore() = default;
    virtual std::optional<std::string> read_key(Provider provider) const = 0;
};

/// Reads the provider's environment variable (OPENAI_API_KEY, ...), then
/// falls back to keys from the config file. Looks up on every call.
class EnvSecretStore : public SecretStore {
public:
    explicit EnvSecretStore(std::map<std::string, std::string> config_keys = {});

    std::optional<std::string> read_key(Provider provider) const override;

private:
    std::map<std::string, std::string> config_keys_;
};

/// Fixed keys, for tests and embedding.
class StaticSecretStore : public SecretStore {
public:
    void set(Provider provider, std::string key) { keys_[provider] = std::move(key); }

    std::optional<std::string> read_key(Provider provider) const override;

private:
    std::map<Provider, std::string> keys_;
};

} // namespace recscribe
