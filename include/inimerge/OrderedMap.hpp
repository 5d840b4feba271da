/**
 * @file OrderedMap.hpp
 * @brief Name-keyed map that remembers insertion order
 *
 * Sections in a document and items in a section are looked up by name but
 * must serialize in the order they were first inserted. Lookup goes through
 * a std::map; iteration goes through an explicit list of names.
 */

#ifndef INIMERGE_ORDEREDMAP_HPP
#define INIMERGE_ORDEREDMAP_HPP

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace inimerge {

template <typename V>
class OrderedMap {
public:
    bool contains(const std::string& name) const {
        return values_.count(name) > 0;
    }

    V* find(const std::string& name) {
        auto it = values_.find(name);
        return it == values_.end() ? nullptr : &it->second;
    }

    const V* find(const std::string& name) const {
        auto it = values_.find(name);
        return it == values_.end() ? nullptr : &it->second;
    }

    /**
     * @brief Insert or replace a value
     *
     * A new name is appended to the order; replacing an existing name keeps
     * its original position.
     *
     * @return Reference to the stored value
     */
    V& set(const std::string& name, V value) {
        auto it = values_.find(name);
        if (it != values_.end()) {
            it->second = std::move(value);
            return it->second;
        }
        order_.push_back(name);
        return values_.emplace(name, std::move(value)).first->second;
    }

    /// Remove by name. Returns false if the name was absent.
    bool erase(const std::string& name) {
        if (values_.erase(name) == 0) return false;
        order_.erase(std::find(order_.begin(), order_.end(), name));
        return true;
    }

    const std::vector<std::string>& names() const noexcept { return order_; }
    size_t size() const noexcept { return order_.size(); }
    bool empty() const noexcept { return order_.empty(); }

    bool operator==(const OrderedMap& other) const {
        return order_ == other.order_ && values_ == other.values_;
    }
    bool operator!=(const OrderedMap& other) const { return !(*this == other); }

private:
    std::vector<std::string> order_;
    std::map<std::string, V> values_;
};

} // namespace inimerge

#endif // INIMERGE_ORDEREDMAP_HPP
