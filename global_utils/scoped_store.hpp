#pragma once
#include <cassert>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <optional>

// A stack of scopes. A key resolves to its binding in the innermost scope that defines it.
template <typename K, typename V>
class ScopedStore {
private:
    std::vector<std::unordered_set<K>> scope_list;
    // Bindings of a key, outermost first. Each scope contributes at most one entry per key.
    std::unordered_map<K, std::vector<V>> key_val_map;
public:
    ScopedStore() {}
    void create_new_scope() {
        scope_list.emplace_back();
    }
    // Returns false if [key] is already bound in the innermost scope. Bindings in outer scopes
    // are shadowed, not checked.
    bool insert(const K& key, const V& value) {
        assert(scope_list.size() > 0);
        if(key_in_curr_scope(key)) {
            return false;
        }
        scope_list.back().insert(key);
        key_val_map[key].push_back(value);
        return true;
    }
    std::optional<V> get_value(const K& key) const {
        auto it = key_val_map.find(key);
        if(it == key_val_map.end()) {
            return std::nullopt;
        }
        assert(it->second.size() > 0);
        return it->second.back();
    }
    // Overwrites the innermost visible binding of [key]. Returns false if there is none.
    bool set_value(const K& key, const V& value) {
        auto it = key_val_map.find(key);
        if(it == key_val_map.end()) {
            return false;
        }
        assert(it->second.size() > 0);
        it->second.back() = value;
        return true;
    }

    bool key_in_curr_scope(const K& key) const {
        assert(scope_list.size() > 0);
        return scope_list.back().find(key) != scope_list.back().end();
    }

    void pop_scope() {
        assert(scope_list.size() > 0);
        for(const K& k: scope_list.back()) {
            auto it = key_val_map.find(k);
            assert(it != key_val_map.end());
            assert(it->second.size() > 0);
            it->second.pop_back();
            if(it->second.empty()) {
                key_val_map.erase(it);
            }
        }
        scope_list.pop_back();
    }
};
