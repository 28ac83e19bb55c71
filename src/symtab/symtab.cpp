/**
 * Symbol Table Implementation
 */

#include "symtab/symtab.hpp"
#include <algorithm>
#include <cctype>

namespace minipas {
namespace symtab {

std::string Symtab::normalize(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

SymtabEntry* Symtab::lookup(const std::string& name) {
    auto it = entries_.find(normalize(name));
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

const SymtabEntry* Symtab::lookup(const std::string& name) const {
    auto it = entries_.find(normalize(name));
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

SymtabEntry* Symtab::enter(const std::string& name) {
    auto result = entries_.emplace(normalize(name), SymtabEntry(name));
    return &result.first->second;
}

std::vector<const SymtabEntry*> Symtab::sortedEntries() const {
    std::vector<const SymtabEntry*> sorted;
    sorted.reserve(entries_.size());
    for (const auto& kv : entries_) {
        sorted.push_back(&kv.second);
    }
    return sorted;
}

void Symtab::dump(std::ostream& out) const {
    for (const auto* entry : sortedEntries()) {
        out << entry->getName() << " = " << entry->getValue() << "\n";
    }
}

} // namespace symtab
} // namespace minipas
