#include "credential.hpp"
#include "endpoint.hpp"
#include "logger.hpp"
#include "toml_json.hpp"
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace {

using Failure = std::pair<CredentialError, std::string>;

std::unexpected<Failure> failure(CredentialError kind, std::string detail) {
    Failure error = std::make_pair(kind, std::move(detail));
    Logger::log(LogLevel::ERROR, Credential::errorToString(error), true);
    return std::unexpected(std::move(error));
}

std::expected<std::string, Failure> readFile(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return failure(CredentialError::IoError,
                       "Cannot access " + path.string() + ": " + (ec ? ec.message() : "no such file"));
    }
    if (!fs::is_regular_file(status)) {
        return failure(CredentialError::IoError, "Not a regular file: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return failure(CredentialError::IoError, "Could not open " + path.string());
    }
    std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return failure(CredentialError::IoError, "Could not read " + path.string());
    }
    return contents;
}

std::expected<std::string, Failure> requireString(const toml::table& table, std::string_view key,
                                                  const std::string& fieldName) {
    const auto* value = table.get_as<std::string>(key);
    if (!value) {
        return failure(CredentialError::MissingField, fieldName);
    }
    return value->get();
}

}

Credential::Credential(std::string host, std::string applicationKey, std::string applicationSecret,
                       std::string consumerKey)
    : host_(std::move(host)),
      applicationKey_(std::move(applicationKey)),
      applicationSecret_(std::move(applicationSecret)),
      consumerKey_(std::move(consumerKey)) {}

Credential::Credential(std::string host, std::string applicationKey, std::string applicationSecret,
                       std::string consumerKey, std::string sourcePath, Json::Value rawConfig)
    : host_(std::move(host)),
      applicationKey_(std::move(applicationKey)),
      applicationSecret_(std::move(applicationSecret)),
      consumerKey_(std::move(consumerKey)),
      sourcePath_(std::move(sourcePath)),
      rawConfig_(std::move(rawConfig)) {}

CredentialResult Credential::loadDefault() {
    return load(DEFAULT_CONFIG_PATH);
}

CredentialResult Credential::load(const fs::path& path) {
    Logger::log(LogLevel::INFO, "Loading credentials from " + path.string(), true);

    auto text = readFile(path);
    if (!text) return std::unexpected(text.error());

    toml::table root;
    try {
        root = toml::parse(std::string_view(*text), path.string());
    } catch (const toml::parse_error& error) {
        const auto& begin = error.source().begin;
        return failure(CredentialError::ParseError, path.string() + ":" + std::to_string(begin.line) + ":" +
                                                        std::to_string(begin.column) + ": " +
                                                        std::string(error.description()));
    }

    const toml::table* defaults = root.get_as<toml::table>("default");
    if (!defaults) {
        return failure(CredentialError::MissingField, "default.endpoint");
    }
    auto endpoint = requireString(*defaults, "endpoint", "default.endpoint");
    if (!endpoint) return std::unexpected(endpoint.error());

    std::string host = EndpointResolver::resolve(*endpoint);
    if (!EndpointResolver::isKnown(*endpoint)) {
        Logger::log(LogLevel::WARNING, "Unknown endpoint '" + *endpoint + "', falling back to " + host, true);
    }

    // The section is named after the endpoint id, not the resolved host.
    const toml::table* section = root.get_as<toml::table>(*endpoint);
    if (!section) {
        return failure(CredentialError::MissingField, *endpoint);
    }

    auto applicationKey = requireString(*section, "application_key", *endpoint + ".application_key");
    if (!applicationKey) return std::unexpected(applicationKey.error());
    auto applicationSecret = requireString(*section, "application_secret", *endpoint + ".application_secret");
    if (!applicationSecret) return std::unexpected(applicationSecret.error());
    auto consumerKey = requireString(*section, "consumer_key", *endpoint + ".consumer_key");
    if (!consumerKey) return std::unexpected(consumerKey.error());

    Logger::log(LogLevel::INFO, "Credentials loaded for endpoint " + *endpoint + " (" + host + ")", true);
    return Credential(std::move(host), std::move(*applicationKey), std::move(*applicationSecret),
                      std::move(*consumerKey), path.string(), tomlToJson(*section));
}

Credential Credential::fromApplication(std::string_view endpoint, std::string_view applicationKey,
                                       std::string_view applicationSecret) {
    return fromCredential(endpoint, applicationKey, applicationSecret, "");
}

Credential Credential::fromCredential(std::string_view endpoint, std::string_view applicationKey,
                                      std::string_view applicationSecret, std::string_view consumerKey) {
    return Credential(EndpointResolver::resolve(endpoint), std::string(applicationKey),
                      std::string(applicationSecret), std::string(consumerKey));
}

std::string Credential::errorToString(const std::pair<CredentialError, std::string>& error) {
    switch (error.first) {
    case CredentialError::IoError:
        return "I/O error: " + error.second;
    case CredentialError::ParseError:
        return "Parse error: " + error.second;
    case CredentialError::MissingField:
        return "Missing or non-string field: " + error.second;
    }
    return error.second;
}
