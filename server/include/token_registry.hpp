#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>

struct TokenCheck {
    int status = 200; // 200, 401 or 403
    std::string error;

    bool ok() const { return this->status == 200; }
};

// short-lived upload tokens, each bound to a single object key
class TokenRegistry {
public:
    using Clock = std::chrono::steady_clock;

    std::string issue(const std::string &object_key, std::chrono::seconds ttl);
    TokenCheck check(const std::string &token, const std::string &object_key) const;
    std::size_t purgeExpired();
    std::size_t size() const { return this->grants.size(); }

private:
    struct Grant {
        std::string object_key;
        Clock::time_point expires;
    };
    std::unordered_map<std::string, Grant> grants;
};
