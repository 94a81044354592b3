#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "a2a/core/types.hpp"
#include "a2a/runtime/interceptor.hpp"

namespace a2a::plugin {

// Abstract interface for one credential scheme an agent accepts.
// The gatekeeper knows nothing about how a scheme validates its credential.
class CredentialScheme {
 public:
  virtual ~CredentialScheme() = default;

  // Scheme identifier, also the key under securitySchemes (e.g. "apiKey")
  virtual std::string scheme() const = 0;

  // OpenAPI-style security scheme object published on the card
  virtual json security_scheme() const = 0;

  // nullopt when the request carries no credential for this scheme,
  // otherwise whether the presented credential is accepted
  virtual std::optional<bool> verify(const Headers& headers) const = 0;
};

using CredentialSchemePtr = std::shared_ptr<CredentialScheme>;

// X-API-Key header checked against a fixed key set
class ApiKeyScheme : public CredentialScheme {
 public:
  explicit ApiKeyScheme(std::set<std::string> keys, std::string header = "X-API-Key");

  std::string scheme() const override {
    return "apiKey";
  }

  json security_scheme() const override;

  std::optional<bool> verify(const Headers& headers) const override;

 private:
  std::set<std::string> keys_;
  std::string header_;
};

// Authorization: Bearer <token> checked against a fixed token set
class BearerScheme : public CredentialScheme {
 public:
  explicit BearerScheme(std::set<std::string> tokens);

  std::string scheme() const override {
    return "bearer";
  }

  json security_scheme() const override;

  std::optional<bool> verify(const Headers& headers) const override;

 private:
  std::set<std::string> tokens_;
};

// Request interceptor: a request passes when any registered scheme accepts
// its credential; otherwise it is answered with -32001 and
// data {"required_auth": [scheme names]}.
class CredentialGatekeeper : public RequestInterceptor {
 public:
  void register_scheme(CredentialSchemePtr scheme);

  std::string name() const override {
    return "credential-gatekeeper";
  }

  std::optional<JsonRpcError> intercept(const JsonRpcRequest& request, const Headers& headers) override;

  // For AgentIdentity::security_schemes
  std::map<std::string, json> security_schemes() const;

  std::vector<std::string> scheme_names() const;

 private:
  mutable std::mutex mutex_;
  std::vector<CredentialSchemePtr> schemes_;
};

}  // namespace a2a::plugin
