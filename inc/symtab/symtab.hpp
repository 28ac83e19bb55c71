/**
 * Symbol Table - flat, case-insensitive variable storage
 *
 * One table per program run. Every entry holds a single numeric value
 * that starts at zero. Entries never move once entered, so callers may
 * hold on to the pointers returned by enter()/lookup().
 */

#ifndef MINIPAS_SYMTAB_HPP
#define MINIPAS_SYMTAB_HPP

#include <map>
#include <string>
#include <vector>
#include <ostream>

namespace minipas {
namespace symtab {

/**
 * One declared variable
 */
class SymtabEntry {
public:
    explicit SymtabEntry(const std::string& name) : name_(name), value_(0.0) {}

    const std::string& getName() const { return name_; }

    double getValue() const { return value_; }
    void setValue(double value) { value_ = value; }

private:
    std::string name_;   // Spelling at first entry
    double value_;
};

class Symtab {
public:
    /**
     * Find an entry; nullptr when the name was never entered
     */
    SymtabEntry* lookup(const std::string& name);
    const SymtabEntry* lookup(const std::string& name) const;

    /**
     * Enter a name, returning the existing entry if already present
     */
    SymtabEntry* enter(const std::string& name);

    size_t size() const { return entries_.size(); }

    /**
     * Entries ordered by lowercased name
     */
    std::vector<const SymtabEntry*> sortedEntries() const;

    /**
     * Print "name = value" lines for every entry
     */
    void dump(std::ostream& out) const;

    static std::string normalize(const std::string& name);

private:
    std::map<std::string, SymtabEntry> entries_;
};

} // namespace symtab
} // namespace minipas

#endif // MINIPAS_SYMTAB_HPP
