/***
 * Name: puretop::ast::SourceComments (impl)
 */
#include "ast/SourceComments.h"

namespace puretop::ast {

void SourceComments::addLeading(const std::size_t pos, Comment comment) {
    leading_[pos].push_back(std::move(comment));
}

const std::vector<Comment>& SourceComments::leading(const std::size_t pos) const {
    static const std::vector<Comment> kEmpty{};
    const auto it = leading_.find(pos);
    return it == leading_.end() ? kEmpty : it->second;
}

bool SourceComments::hasLeading(const std::size_t pos) const {
    const auto it = leading_.find(pos);
    return it != leading_.end() && !it->second.empty();
}

bool SourceComments::anyLeading(const std::size_t pos, const std::function<bool(const Comment&)>& pred) const {
    for (const auto& c : leading(pos)) {
        if (pred(c)) { return true; }
    }
    return false;
}

std::vector<std::pair<std::size_t, const Comment*>> SourceComments::synthesized() const {
    std::vector<std::pair<std::size_t, const Comment*>> out;
    for (const auto& [pos, list] : leading_) {
        for (const auto& c : list) {
            if (c.synthesized) { out.emplace_back(pos, &c); }
        }
    }
    return out;
}

std::size_t SourceComments::size() const {
    std::size_t n = 0;
    for (const auto& entry : leading_) { n += entry.second.size(); }
    return n;
}

std::size_t SourceComments::synthesizedCount() const {
    std::size_t n = 0;
    for (const auto& entry : leading_) {
        for (const auto& c : entry.second) {
            if (c.synthesized) { ++n; }
        }
    }
    return n;
}

} // namespace puretop::ast
