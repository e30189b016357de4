/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include <initializer_list>
#include <utility>
#include <unordered_map>
#include <stdexcept>
#include <cstddef>

namespace wa {

// Insertion-ordered string-keyed map. get() returns nullptr on a missing key.
template <class V>
class OrderedMap {
public:
    using value_type     = std::pair<std::string, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    OrderedMap() = default;
    OrderedMap(std::initializer_list<value_type> init) {
        for (const auto& kv : init) set(kv.first, kv.second);
    }

    const V* get(const std::string& key) const {
        auto it = _index.find(key);
        return it == _index.end() ? nullptr : &_items[it->second].second;
    }

    V* get(const std::string& key) {
        auto it = _index.find(key);
        return it == _index.end() ? nullptr : &_items[it->second].second;
    }

    const V& at(const std::string& key) const {
        const V* v = get(key);
        if (!v) throw std::out_of_range("no such key: " + key);
        return *v;
    }

    bool contains(const std::string& key) const { return _index.count(key) != 0; }

    // Overwriting keeps the key at its original position.
    void set(const std::string& key, V value) {
        auto it = _index.find(key);
        if (it != _index.end()) {
            _items[it->second].second = std::move(value);
            return;
        }
        _index.emplace(key, _items.size());
        _items.emplace_back(key, std::move(value));
    }

    bool erase(const std::string& key) {
        auto it = _index.find(key);
        if (it == _index.end()) return false;
        _items.erase(_items.begin() + (long)it->second);
        _index.clear();
        for (std::size_t i = 0; i < _items.size(); ++i) _index.emplace(_items[i].first, i);
        return true;
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> k;
        k.reserve(_items.size());
        for (const auto& kv : _items) k.push_back(kv.first);
        return k;
    }

    std::size_t size() const { return _items.size(); }
    bool empty() const { return _items.empty(); }
    void clear() { _items.clear(); _index.clear(); }

    const_iterator begin() const { return _items.begin(); }
    const_iterator end() const { return _items.end(); }

private:
    std::vector<value_type> _items;
    std::unordered_map<std::string, std::size_t> _index;
};

// Outbound header sequence, insertion-ordered.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

} // namespace wa
