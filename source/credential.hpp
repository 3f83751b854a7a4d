#ifndef CREDENTIAL_HPP
#define CREDENTIAL_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <json/json.h>

enum class CredentialError { IoError, ParseError, MissingField };

class Credential;

// On MissingField the string is the dotted name of the absent field,
// otherwise it is the reason for the failure.
using CredentialResult = std::expected<Credential, std::pair<CredentialError, std::string>>;

// OVH API credentials: host plus application key, application secret and
// consumer key. Immutable once built.
class Credential {
public:
    static inline const char* DEFAULT_CONFIG_PATH = "Config.toml";

    // Reads DEFAULT_CONFIG_PATH from the working directory.
    static CredentialResult loadDefault();

    // Expects a [default] table naming the endpoint and a table named after
    // that endpoint holding application_key, application_secret and
    // consumer_key.
    static CredentialResult load(const std::filesystem::path& path);

    static Credential fromApplication(std::string_view endpoint, std::string_view applicationKey,
                                      std::string_view applicationSecret);
    static Credential fromCredential(std::string_view endpoint, std::string_view applicationKey,
                                     std::string_view applicationSecret, std::string_view consumerKey);

    static std::string errorToString(const std::pair<CredentialError, std::string>& error);

    const std::string& host() const { return host_; }
    const std::string& applicationKey() const { return applicationKey_; }
    const std::string& applicationSecret() const { return applicationSecret_; }
    const std::string& consumerKey() const { return consumerKey_; }

    // Set together, and only for credentials read from a file.
    const std::optional<std::string>& sourcePath() const { return sourcePath_; }
    const std::optional<Json::Value>& rawConfig() const { return rawConfig_; }
    bool fromFile() const { return sourcePath_.has_value(); }

    bool operator==(const Credential& other) const = default;

private:
    Credential(std::string host, std::string applicationKey, std::string applicationSecret,
               std::string consumerKey);
    Credential(std::string host, std::string applicationKey, std::string applicationSecret,
               std::string consumerKey, std::string sourcePath, Json::Value rawConfig);

    std::string host_;
    std::string applicationKey_;
    std::string applicationSecret_;
    std::string consumerKey_;
    std::optional<std::string> sourcePath_;
    std::optional<Json::Value> rawConfig_;
};

#endif
