#include "a2a/plugin/credential_gatekeeper.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace a2a::plugin {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<std::string> find_header(const Headers& headers, const std::string& name) {
  auto it = headers.find(to_lower(name));
  if (it == headers.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

ApiKeyScheme::ApiKeyScheme(std::set<std::string> keys, std::string header) : keys_(std::move(keys)), header_(std::move(header)) {}

json ApiKeyScheme::security_scheme() const {
  return {{"type", "apiKey"}, {"in", "header"}, {"name", header_}};
}

std::optional<bool> ApiKeyScheme::verify(const Headers& headers) const {
  auto key = find_header(headers, header_);
  if (!key) return std::nullopt;
  return keys_.count(*key) > 0;
}

BearerScheme::BearerScheme(std::set<std::string> tokens) : tokens_(std::move(tokens)) {}

json BearerScheme::security_scheme() const {
  return {{"type", "http"}, {"scheme", "bearer"}, {"bearerFormat", "JWT"}};
}

std::optional<bool> BearerScheme::verify(const Headers& headers) const {
  auto auth = find_header(headers, "Authorization");
  if (!auth) return std::nullopt;

  constexpr size_t kPrefixLen = 7;  // "Bearer "
  if (auth->size() <= kPrefixLen || to_lower(auth->substr(0, kPrefixLen)) != "bearer ") {
    return std::nullopt;
  }
  return tokens_.count(auth->substr(kPrefixLen)) > 0;
}

void CredentialGatekeeper::register_scheme(CredentialSchemePtr scheme) {
  std::lock_guard lock(mutex_);
  spdlog::info("[Plugin] Registered credential scheme: {}", scheme->scheme());
  schemes_.push_back(std::move(scheme));
}

std::optional<JsonRpcError> CredentialGatekeeper::intercept(const JsonRpcRequest& request, const Headers& headers) {
  std::vector<CredentialSchemePtr> schemes;
  {
    std::lock_guard lock(mutex_);
    schemes = schemes_;
  }

  bool presented = false;
  for (const auto& scheme : schemes) {
    auto verdict = scheme->verify(headers);
    if (!verdict) continue;
    if (*verdict) {
      spdlog::debug("[Plugin] {} accepted by {}", request.method, scheme->scheme());
      return std::nullopt;
    }
    presented = true;
  }

  JsonRpcError error;
  error.code = error_codes::kAuthRequired;
  error.message = presented ? "Invalid credentials" : "Authentication required";
  error.data = json{{"required_auth", scheme_names()}};
  return error;
}

std::map<std::string, json> CredentialGatekeeper::security_schemes() const {
  std::lock_guard lock(mutex_);
  std::map<std::string, json> out;
  for (const auto& scheme : schemes_) {
    out[scheme->scheme()] = scheme->security_scheme();
  }
  return out;
}

std::vector<std::string> CredentialGatekeeper::scheme_names() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> names;
  for (const auto& scheme : schemes_) {
    names.push_back(scheme->scheme());
  }
  return names;
}

}  // namespace a2a::plugin
