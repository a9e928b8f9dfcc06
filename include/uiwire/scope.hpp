#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "uiwire/symbol.hpp"


namespace uiwire {

/*
===============================================================================
 ScopeChain
===============================================================================

Persistent (immutable, structurally shared) list of symbols, leaf first.

  • push() returns a new chain one symbol deeper; the receiver is unchanged
  • siblings derived from the same parent share only immutable nodes
  • snapshot() flattens root → leaf into an EventPath
  • an empty symbol is never pushed: push("") logs and returns the receiver

Copying a chain is a reference-count bump. Chains are safe to hand out to
nested UI-building code without any aliasing concerns.
===============================================================================
*/
class ScopeChain {
public:
    ScopeChain() = default;

    explicit ScopeChain(std::string_view root)
        : head_(std::make_shared<const Node>(Node{Symbol(root), nullptr, 1}))
    {}

    [[nodiscard]]
    ScopeChain push(Symbol symbol) const;

    [[nodiscard]]
    EventPath snapshot() const;

    [[nodiscard]] inline std::size_t depth() const noexcept { return head_ ? head_->depth : 0; }
    [[nodiscard]] inline bool empty() const noexcept { return head_ == nullptr; }

    // Leaf symbol (empty chain → empty view)
    [[nodiscard]] inline std::string_view leaf() const noexcept {
        return head_ ? std::string_view(head_->symbol) : std::string_view{};
    }

private:
    struct Node {
        Symbol symbol;
        std::shared_ptr<const Node> parent;
        std::size_t depth;
    };

    explicit ScopeChain(std::shared_ptr<const Node> head) noexcept
        : head_(std::move(head))
    {}

    std::shared_ptr<const Node> head_;
};

} // namespace uiwire
