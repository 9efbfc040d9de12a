#pragma once

#include "core/error.hpp"
#include "session/credential_directory.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace mcpgate {

/**
 * @brief Credentials presented on a session-initialization request
 */
struct InitCredentials {
    std::string service_secret;     // From "Authorization: Bearer <secret>"
    std::string user_id;            // X-User-Id
    std::string api_key;            // X-Api-Key
};

/**
 * @brief Two-factor check for session initialization
 *
 * 1. Shared service secret (constant-time compare)
 * 2. Per-user API key resolved through the credential directory, and the
 *    user must be allowed on the target backend
 *
 * An empty configured service secret disables the first factor.
 */
class SessionAuthenticator {
public:
    SessionAuthenticator(std::string service_secret,
                         std::shared_ptr<ICredentialDirectory> directory);

    [[nodiscard]] Result<CredentialRecord> authenticate(const InitCredentials& credentials,
                                                        const std::string& backend) const;

    [[nodiscard]] bool requires_service_secret() const { return !service_secret_.empty(); }

private:
    std::string service_secret_;
    std::shared_ptr<ICredentialDirectory> directory_;
};

/// Constant-time string comparison for secrets
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b);

} // namespace mcpgate
