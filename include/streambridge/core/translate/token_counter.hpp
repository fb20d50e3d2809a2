#pragma once
#include <algorithm>
#include <cstdint>
#include <memory>
#include <string_view>

namespace StreamBridge {

/**
 * @class TokenCounter
 * @brief Output-token estimation seam; real tokenizers live outside the core.
 */
class TokenCounter {
public:
    virtual ~TokenCounter() = default;
    virtual uint32_t count(std::string_view text) const = 0;
};

using TokenCounterPtr = std::shared_ptr<const TokenCounter>;

// Roughly four characters per token, never zero.
class HeuristicTokenCounter : public TokenCounter {
public:
    uint32_t count(std::string_view text) const override {
        return std::max<uint32_t>(1, static_cast<uint32_t>(text.size() / 4));
    }
};

} // namespace StreamBridge
