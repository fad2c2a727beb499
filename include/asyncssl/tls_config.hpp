#ifndef ASYNCSSL_TLS_CONFIG_HPP_
#define ASYNCSSL_TLS_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace asyncssl {

enum class TlsRole {
    CLIENT,
    SERVER,
};

enum class TlsVersion {
    VERSION_1_0,
    VERSION_1_1,
    VERSION_1_2,
    VERSION_1_3,
};

class TlsConfig {
public:
    class Builder;

    // Should be used when no CA is configured.
    // Loading of defaults fails if both fail, while loading of custom locations fails if any fails.
    static auto defaultCaCert() -> std::string;
    static auto defaultCaPath() -> std::string;

    auto role() const { return role_; }
    auto minTlsVersion() const { return minTlsVersion_; }
    auto const& caCert() const { return caCert_; }
    auto const& caPath() const { return caPath_; }
    auto const& caCertPem() const { return caCertPem_; }
    auto const& certificateChain() const { return certificateChain_; }
    auto const& certificateChainPem() const { return certificateChainPem_; }
    auto const& privateKey() const { return privateKey_; }
    auto const& privateKeyPem() const { return privateKeyPem_; }
    auto const& serverName() const { return serverName_; }
    auto insecure() const { return insecure_; }
    auto maxEarlyData() const { return maxEarlyData_; }

    auto useDefaultCa() const { return !caCert_ && !caPath_ && !caCertPem_; }
    auto hasIdentity() const { return (certificateChain_ || certificateChainPem_) && (privateKey_ || privateKeyPem_); }

private:
    TlsConfig() = default;

    TlsRole role_{TlsRole::CLIENT};
    TlsVersion minTlsVersion_{TlsVersion::VERSION_1_2};
    std::optional<std::string> caCert_;
    std::optional<std::string> caPath_;
    std::optional<std::string> caCertPem_;
    std::optional<std::string> certificateChain_;
    std::optional<std::string> certificateChainPem_;
    std::optional<std::string> privateKey_;
    std::optional<std::string> privateKeyPem_;
    std::optional<std::string> serverName_;
    bool insecure_{false};
    uint32_t maxEarlyData_{0};
};

class TlsConfig::Builder {
public:
    auto build() const -> TlsConfig { return config_; }

    auto role(TlsRole value) -> Builder& { config_.role_ = value; return *this; }
    auto minTlsVersion(TlsVersion value) -> Builder& { config_.minTlsVersion_ = value; return *this; }
    auto caCert(std::string value) -> Builder& { config_.caCert_ = std::move(value); return *this; }
    auto caPath(std::string value) -> Builder& { config_.caPath_ = std::move(value); return *this; }
    auto caCertPem(std::string value) -> Builder& { config_.caCertPem_ = std::move(value); return *this; }
    auto certificateChain(std::string value) -> Builder& { config_.certificateChain_ = std::move(value); return *this; }
    auto certificateChainPem(std::string value) -> Builder& { config_.certificateChainPem_ = std::move(value); return *this; }
    auto privateKey(std::string value) -> Builder& { config_.privateKey_ = std::move(value); return *this; }
    auto privateKeyPem(std::string value) -> Builder& { config_.privateKeyPem_ = std::move(value); return *this; }
    auto serverName(std::string value) -> Builder& { config_.serverName_ = std::move(value); return *this; }
    auto insecure(bool value) -> Builder& { config_.insecure_ = value; return *this; }
    auto maxEarlyData(uint32_t value) -> Builder& { config_.maxEarlyData_ = value; return *this; }

private:
    TlsConfig config_;
};

}  // namespace asyncssl

#endif  // ASYNCSSL_TLS_CONFIG_HPP_
