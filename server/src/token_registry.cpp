#include "token_registry.hpp"

#include "uplink/hasher.hpp"

std::string TokenRegistry::issue(const std::string &object_key, std::chrono::seconds ttl) {
    std::string token = uplink::random_hex(24);
    this->grants[token] = Grant{object_key, Clock::now() + ttl};
    return token;
}

TokenCheck TokenRegistry::check(const std::string &token, const std::string &object_key) const {
    auto it = this->grants.find(token);
    if (token.empty() || it == this->grants.end()) {
        return TokenCheck{401, "invalid_token: Unknown upload token"};
    }
    if (Clock::now() >= it->second.expires) {
        return TokenCheck{401, "expired_token: Upload token has expired"};
    }
    if (it->second.object_key != object_key) {
        return TokenCheck{403, "forbidden: Token not valid for object " + object_key};
    }
    return TokenCheck{};
}

std::size_t TokenRegistry::purgeExpired() {
    std::size_t n = 0;
    auto now = Clock::now();
    for (auto it = this->grants.begin(); it != this->grants.end();) {
        if (now >= it->second.expires) {
            it = this->grants.erase(it);
            n++;
        } else {
            ++it;
        }
    }
    return n;
}
