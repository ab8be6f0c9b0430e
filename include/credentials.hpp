/**
 * @file credentials.hpp
 * @brief Connection identity and in-memory secret handling for one delivery run.
 *
 * The secret is held in a ScopedSecret, which wipes its buffer when cleared, moved from,
 * or destroyed. Credentials are built per invocation and never written anywhere.
 */

#ifndef CREDENTIALS_HPP
#define CREDENTIALS_HPP

#include <string>
#include <string_view>

/**
 * @brief Owning holder for a password or key-file reference that zeroes itself.
 *
 * Copying is disabled so the secret exists in exactly one buffer. Moving transfers the
 * buffer and wipes the source.
 */
class ScopedSecret {
public:
    ScopedSecret() = default;
    explicit ScopedSecret(std::string value);
    ScopedSecret(const ScopedSecret&) = delete;
    ScopedSecret& operator=(const ScopedSecret&) = delete;
    ScopedSecret(ScopedSecret&& other);
    ScopedSecret& operator=(ScopedSecret&& other);
    ~ScopedSecret();

    /**
     * @brief Overwrites the buffer with zeros and empties it.
     */
    void clear() noexcept;

    bool empty() const noexcept { return value_.empty(); }
    std::string_view view() const noexcept { return value_; }
    const char* c_str() const noexcept { return value_.c_str(); }

private:
    std::string value_;
};

/**
 * @brief Overwrites a string's characters with zeros in a way the optimizer keeps.
 */
void secureWipe(std::string& text) noexcept;

/**
 * @brief What the secret refers to.
 */
enum class SecretKind {
    Password, ///< Secret is the account password.
    KeyFile   ///< Secret is the path of a private key file.
};

/**
 * @brief Remote identity for one run.
 */
struct Credentials {
    std::string host;                           ///< Remote host name or address.
    int port = 22;                              ///< SSH port.
    std::string username;                       ///< Remote account.
    SecretKind secretKind = SecretKind::Password; ///< Interpretation of secret.
    ScopedSecret secret;                        ///< Password or key-file path.
};

#endif // CREDENTIALS_HPP
