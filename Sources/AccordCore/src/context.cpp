#include "accord/context.hpp"
#include <stdexcept>

namespace accord {

context::context(std::initializer_list<entry> init) {
    for (const auto& [key, value] : init) {
        set(key, value);
    }
}

bool context::contains(const std::string& key) const {
    return find(key) != nullptr;
}

bool context::has_value(const std::string& key) const {
    const value_t* value = find(key);
    return value != nullptr && !is_null(*value);
}

const value_t* context::find(const std::string& key) const {
    for (const auto& e : entries_) {
        if (e.first == key) return &e.second;
    }
    return nullptr;
}

value_t* context::find(const std::string& key) {
    for (auto& e : entries_) {
        if (e.first == key) return &e.second;
    }
    return nullptr;
}

const value_t& context::at(const std::string& key) const {
    const value_t* value = find(key);
    if (!value) {
        throw std::out_of_range("No context value named '" + key + "'");
    }
    return *value;
}

void context::set(const std::string& key, value_t value) {
    if (value_t* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    entries_.emplace_back(key, std::move(value));
}

bool context::erase(const std::string& key) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

std::vector<std::string> context::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& e : entries_) {
        result.push_back(e.first);
    }
    return result;
}

std::string context::to_string() const {
    std::string result = "{";
    bool first = true;
    for (const auto& [key, value] : entries_) {
        if (!first) result += ", ";
        result += key + ": " + describe(value);
        first = false;
    }
    result += "}";
    return result;
}

} // namespace accord
