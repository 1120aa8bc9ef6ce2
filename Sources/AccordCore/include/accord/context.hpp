#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace accord {

// ============================================================================
// context - ordered name -> value mapping shared by the entities of one
// transaction. Keys are unique and iterate in insertion order; setting an
// existing key replaces its value in place.
// ============================================================================

class context {
public:
    using entry = std::pair<std::string, value_t>;
    using const_iterator = std::vector<entry>::const_iterator;

    context() = default;
    context(std::initializer_list<entry> init);

    bool contains(const std::string& key) const;

    /// True when the key is present and its value is not null.
    bool has_value(const std::string& key) const;

    const value_t* find(const std::string& key) const;
    value_t* find(const std::string& key);

    // Throws std::out_of_range if the key is absent
    const value_t& at(const std::string& key) const;

    void set(const std::string& key, value_t value);
    bool erase(const std::string& key);
    void clear() { entries_.clear(); }

    std::vector<std::string> keys() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const context& other) const { return entries_ == other.entries_; }
    bool operator!=(const context& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    std::vector<entry> entries_;
};

} // namespace accord

#endif // __cplusplus
