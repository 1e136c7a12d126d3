/***
 * Name: puretop::purity::Denylist (impl)
 * Purpose: Default helper names and suffix-insensitive membership.
 */
#include "purity/Denylist.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace puretop::purity {

namespace {
using NameSet = std::set<std::string, std::less<>>;

// `name$<digits>` -> `name`; anything else unchanged
std::string_view stripSegment(std::string_view segment) {
    const auto dollar = segment.rfind('$');
    if (dollar == std::string_view::npos || dollar == 0 || dollar + 1 == segment.size()) { return segment; }
    for (std::size_t i = dollar + 1; i < segment.size(); ++i) {
        if (segment[i] < '0' || segment[i] > '9') { return segment; }
    }
    return segment.substr(0, dollar);
}
} // namespace

Denylist::Denylist() : names_(std::make_shared<const NameSet>()) {}

Denylist::Denylist(const std::vector<std::string>& names)
    : names_(std::make_shared<const NameSet>(names.begin(), names.end())) {}

const std::vector<std::string>& Denylist::defaultNames() {
    static const std::vector<std::string> kNames{
        // CommonJS/ESM interop
        "__createBinding", "__setModuleDefault", "__importStar", "__importDefault",
        // down-leveling helpers
        "__extends", "__assign", "__rest", "__decorate", "__param", "__metadata",
        "__awaiter", "__generator", "__exportStar", "__values", "__read", "__spread",
        "__spreadArrays", "__spreadArray", "__await", "__asyncGenerator", "__asyncDelegator",
        "__asyncValues", "__makeTemplateObject", "__classPrivateFieldGet", "__classPrivateFieldSet",
        "__classPrivateFieldIn", "__esDecorate", "__runInitializers", "__propKey",
        "__setFunctionName", "__addDisposableResource", "__disposeResources",
    };
    return kNames;
}

const Denylist& Denylist::defaults() {
    static const Denylist kDefaults{defaultNames()};
    return kDefaults;
}

std::string Denylist::stripRenameSuffixes(std::string_view descriptor) {
    std::string out;
    out.reserve(descriptor.size());
    std::size_t start = 0;
    while (true) {
        const auto dot = descriptor.find('.', start);
        const auto segment = descriptor.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        out.append(stripSegment(segment));
        if (dot == std::string_view::npos) { break; }
        out.push_back('.');
        start = dot + 1;
    }
    return out;
}

bool Denylist::contains(std::string_view descriptor) const {
    if (names_->find(descriptor) != names_->end()) { return true; }
    const auto stripped = stripRenameSuffixes(descriptor);
    if (stripped.size() == descriptor.size()) { return false; }
    return names_->find(stripped) != names_->end();
}

Denylist Denylist::with(const std::vector<std::string>& extra) const {
    std::vector<std::string> merged(names_->begin(), names_->end());
    merged.insert(merged.end(), extra.begin(), extra.end());
    return Denylist{merged};
}

std::vector<std::string> Denylist::names() const {
    return {names_->begin(), names_->end()};
}

} // namespace puretop::purity
