/***
 * Name: puretop::purity::Denylist
 * Purpose: Callee names that must never be marked pure.
 * Inputs:
 *   - Built-in helper names (defaults()) and/or configured names.
 * Outputs:
 *   - contains(descriptor): membership with bundler rename suffixes ignored.
 * Theory of Operation:
 *   Immutable value sharing one sorted set, so copies are cheap and safe to
 *   pass around. A descriptor matches when it equals an entry, or when the
 *   form with a `$<digits>` suffix removed from every dotted segment does
 *   (`__importStar$1`, `tslib_1.__importStar$2`).
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace puretop::purity {

class Denylist {
 public:
    Denylist();
    explicit Denylist(const std::vector<std::string>& names);

    // Process-wide default: interop and down-leveling helper names
    static const Denylist& defaults();
    static const std::vector<std::string>& defaultNames();

    bool contains(std::string_view descriptor) const;

    // New list holding this list's names plus `extra`
    Denylist with(const std::vector<std::string>& extra) const;

    std::size_t size() const { return names_->size(); }
    bool empty() const { return names_->empty(); }
    std::vector<std::string> names() const;

    // `a$1.b$22` -> `a.b`; segments whose `$` suffix is not all digits are kept
    static std::string stripRenameSuffixes(std::string_view descriptor);

 private:
    std::shared_ptr<const std::set<std::string, std::less<>>> names_;
};

} // namespace puretop::purity
