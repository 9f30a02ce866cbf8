#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Scan-ordered, immutable collection of package entries with a name index.
template <typename Entry>
class Catalog {
public:
    using const_iterator = typename std::vector<Entry>::const_iterator;

    Catalog() = default;

    explicit Catalog(std::vector<Entry> entries) : entries_(std::move(entries)) {
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            const std::string& name = entries_[i].identity.name;
            auto [it, inserted] = by_name_.try_emplace(name);
            if (inserted) names_.push_back(name);
            it->second.push_back(i);
        }
    }

    const std::vector<Entry>& entries() const { return entries_; }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Distinct names in order of first appearance.
    const std::vector<std::string>& names() const { return names_; }

    bool contains_name(std::string_view name) const {
        return by_name_.find(name) != by_name_.end();
    }

    std::vector<Entry> find_by_name(std::string_view name) const {
        std::vector<Entry> result;
        if (auto it = by_name_.find(name); it != by_name_.end()) {
            result.reserve(it->second.size());
            for (std::size_t idx : it->second) result.push_back(entries_[idx]);
        }
        return result;
    }

private:
    std::vector<Entry> entries_;
    std::vector<std::string> names_;
    std::map<std::string, std::vector<std::size_t>, std::less<>> by_name_;
};
