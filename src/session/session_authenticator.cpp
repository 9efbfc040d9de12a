#include "session/session_authenticator.hpp"
#include "core/utils.hpp"

#include <format>

#include <openssl/crypto.h>

namespace mcpgate {

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        // Touch b anyway so timing does not depend on where the lengths differ
        volatile unsigned char dummy = 0;
        for (size_t i = 0; i < b.size(); ++i) dummy |= static_cast<unsigned char>(b[i]);
        (void)dummy;
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

SessionAuthenticator::SessionAuthenticator(std::string service_secret,
                                           std::shared_ptr<ICredentialDirectory> directory)
    : service_secret_(std::move(service_secret)),
      directory_(std::move(directory)) {
    if (service_secret_.empty()) {
        utils::log::warn("No service secret configured; session init relies on user API keys only");
    }
}

Result<CredentialRecord> SessionAuthenticator::authenticate(const InitCredentials& credentials,
                                                            const std::string& backend) const {
    if (!service_secret_.empty() &&
        !constant_time_equals(credentials.service_secret, service_secret_)) {
        return Result<CredentialRecord>::error(ErrorCode::AUTH_INVALID,
            "Invalid or missing service token");
    }

    if (credentials.user_id.empty() || credentials.api_key.empty()) {
        return Result<CredentialRecord>::error(ErrorCode::AUTH_INVALID,
            "User id and API key are required");
    }

    auto record = directory_->lookup(credentials.user_id, credentials.api_key);
    if (!record) {
        utils::log::warn(std::format("Rejected API key for user '{}' on backend '{}'",
                                     credentials.user_id, backend));
        return Result<CredentialRecord>::error(ErrorCode::AUTH_INVALID,
            "Invalid or disabled API key");
    }

    if (!record->allows(backend)) {
        return Result<CredentialRecord>::error(ErrorCode::AUTH_INVALID,
            std::format("User '{}' is not permitted on backend '{}'", record->user_id, backend));
    }

    return Result<CredentialRecord>::ok(std::move(*record));
}

} // namespace mcpgate
