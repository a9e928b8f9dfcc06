#include "uiwire/scope.hpp"
#include "lcr/log/logger.hpp"


namespace uiwire {

ScopeChain ScopeChain::push(Symbol symbol) const {
    if (symbol.empty()) {
        UW_ERROR("[SCOPE] Empty symbol pushed onto " << to_string(snapshot()) << " -> ignored.");
        return *this;
    }
    const std::size_t depth = head_ ? head_->depth + 1 : 1;
    return ScopeChain(std::make_shared<const Node>(Node{std::move(symbol), head_, depth}));
}

EventPath ScopeChain::snapshot() const {
    EventPath path(depth());
    std::size_t i = path.size();
    for (const Node* n = head_.get(); n != nullptr; n = n->parent.get()) {
        path[--i] = n->symbol;
    }
    return path;
}

} // namespace uiwire
