#pragma once

// credentials.hpp - credential profiles resolved before anything connects
// secrets stay inside credentials; fmt prints them masked

#include "common.hpp"
#include "device.hpp"

#include <map>
#include <string>
#include <string_view>

namespace netrun
{

    class credential_store
    {
    public:
        credential_store() = default;
        virtual ~credential_store() = default;

        credential_store(credential_store const &) = delete;
        auto operator=(credential_store const &) -> credential_store & = delete;
        credential_store(credential_store &&) = delete;
        auto operator=(credential_store &&) -> credential_store & = delete;

        // errors: credential_unavailable
        [[nodiscard]] virtual auto resolve(std::string_view profile) const -> result<credentials> = 0;
    };

    // ============================================================================
    // in-memory profiles
    // ============================================================================

    class memory_credential_store final : public credential_store
    {
    private:
        std::map<std::string, credentials, std::less<>> profiles_{};

    public:
        memory_credential_store() = default;

        auto add(std::string profile, credentials creds) -> void;

        [[nodiscard]] auto resolve(std::string_view profile) const -> result<credentials> override;
    };

    // ============================================================================
    // environment profiles: <PREFIX>_<PROFILE>_USERNAME / _PASSWORD / _SECRET
    // ============================================================================

    class env_credential_store final : public credential_store
    {
    private:
        std::string prefix_;

    public:
        explicit env_credential_store(std::string prefix = "NETRUN");

        [[nodiscard]] auto resolve(std::string_view profile) const -> result<credentials> override;

        // "core-switches" -> "NETRUN_CORE_SWITCHES"
        [[nodiscard]] auto variable_stem(std::string_view profile) const -> std::string;
    };

} // namespace netrun
