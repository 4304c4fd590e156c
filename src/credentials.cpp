// credentials.cpp - credential profile lookup

#include "netrun/credentials.hpp"

#include <cctype>
#include <cstdlib>
#include <optional>

namespace netrun
{

    namespace
    {

        [[nodiscard]] auto env(std::string const &name) -> std::optional<std::string>
        {
            auto const *value = std::getenv(name.c_str());
            if (value == nullptr)
            {
                return std::nullopt;
            }
            return std::string{value};
        }

    } // namespace

    auto memory_credential_store::add(std::string profile, credentials creds) -> void
    {
        profiles_.insert_or_assign(std::move(profile), std::move(creds));
    }

    auto memory_credential_store::resolve(std::string_view const profile) const -> result<credentials>
    {
        auto const it = profiles_.find(profile);
        if (it == profiles_.end())
        {
            return std::unexpected{make_error(error_code::credential_unavailable, "no profile named '{}'", profile)};
        }
        return it->second;
    }

    env_credential_store::env_credential_store(std::string prefix) : prefix_{std::move(prefix)}
    {
    }

    auto env_credential_store::variable_stem(std::string_view const profile) const -> std::string
    {
        std::string stem = prefix_;
        stem.push_back('_');
        for (auto const c : profile)
        {
            auto const uc = static_cast<unsigned char>(c);
            stem.push_back(std::isalnum(uc) != 0 ? static_cast<char>(std::toupper(uc)) : '_');
        }
        return stem;
    }

    auto env_credential_store::resolve(std::string_view const profile) const -> result<credentials>
    {
        auto const stem = variable_stem(profile);

        auto username = env(stem + "_USERNAME");
        auto password = env(stem + "_PASSWORD");
        if (!username.has_value() || username->empty())
        {
            return std::unexpected{
                make_error(error_code::credential_unavailable, "profile '{}': {}_USERNAME is not set", profile, stem)};
        }
        if (!password.has_value())
        {
            return std::unexpected{
                make_error(error_code::credential_unavailable, "profile '{}': {}_PASSWORD is not set", profile, stem)};
        }

        credentials creds{.username = std::move(*username), .password = std::move(*password), .elevation_secret = {}};
        if (auto secret = env(stem + "_SECRET"); secret.has_value() && !secret->empty())
        {
            creds.elevation_secret = std::move(*secret);
        }
        return creds;
    }

} // namespace netrun
