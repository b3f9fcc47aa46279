#pragma once

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <optional>
#include <sstream>
#include <tuple>
#include <vector>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-copy"
#pragma GCC diagnostic ignored "-Wstrict-aliasing"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "cpp-btree/btree_map.h"
#pragma GCC diagnostic pop

#include "combinatorics.hpp"
#include "debug.hpp"


// Process-wide memo of chi^lambda_mu for one value type, seeded with S_0; grows until clear().
// Lookups and insertions lock separately, a racing second insertion is dropped.
template<typename I = default_value>
class character_cache {
public:
    using key_type = std::tuple<std::vector<uint32_t>, std::vector<uint32_t>>;

    static character_cache& instance() {
        static character_cache cache;
        return cache;
    }

    std::optional<I> find(const partition& lambda, const partition& mu) const {
        std::scoped_lock lock(mutex);
        auto it = values.find(key(lambda, mu));
        if(it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    // Keeps the existing value if the key is already present.
    void insert(const partition& lambda, const partition& mu, const I& value) {
        std::scoped_lock lock(mutex);
        values.insert(std::make_pair(key(lambda, mu), value));
    }
    size_t size() const {
        std::scoped_lock lock(mutex);
        return values.size();
    }
    void clear() {
        std::scoped_lock lock(mutex);
        values.clear();
        seed();
    }

private:
    mutable std::mutex mutex;
    btree::btree_map<key_type, I> values;

    character_cache() {
        seed();
    }
    void seed() {
        values[key_type()] = I(1);
    }
    static key_type key(const partition& lambda, const partition& mu) {
        return key_type(lambda, mu);
    }
};


// (row, column), 0-indexed; row indexes the parts, so the last part is the bottom row.
using border_cell = std::tuple<uint32_t, uint32_t>;

// Boundary cells from the bottom-left corner to the top-right corner.
inline std::vector<border_cell> border_strip(const partition& p) {
    std::vector<border_cell> strip;
    if(p.empty()) {
        return strip;
    }
    const uint32_t n = p.size() + p[0] - 1;
    strip.reserve(n);
    uint32_t row = p.size() - 1, column = 0;
    for(uint32_t i = 0; i < n; ++i) {
        strip.emplace_back(row, column);
        if(p[row] == column + 1) {
            --row;
        } else {
            ++column;
        }
    }
    return strip;
}

// Whether strip[i .. i + k) can be removed leaving a partition.
inline bool is_rim_hook(const std::vector<border_cell>& strip, uint32_t i, uint32_t k) {
    if(k == 0 or i + k > strip.size()) {
        return false;
    }
    // The path must step right into the first cell and up out of the last one.
    if(i > 0 and std::get<1>(strip[i - 1]) == std::get<1>(strip[i])) {
        return false;
    }
    if(i + k < strip.size() and std::get<0>(strip[i + k]) == std::get<0>(strip[i + k - 1])) {
        return false;
    }
    return true;
}

// Removes the cells strip[i .. i + k) from p.
inline partition remove_rim_hook(const partition& p, const std::vector<border_cell>& strip, uint32_t i, uint32_t k) {
    std::vector<uint32_t> q(p.begin(), p.end());
    for(uint32_t j = i; j < i + k; ++j) {
        --q[std::get<0>(strip[j])];
    }
    std::sort(q.rbegin(), q.rend());
    while(q.size() and q.back() == 0) {
        q.pop_back();
    }
    return partition(std::move(q));
}


template<typename I>
I _character_value_impl(const partition& lambda, const partition& mu, character_cache<I>& cache) {
    if(auto hit = cache.find(lambda, mu)) {
        return *hit;
    }
    if(std::all_of(mu.begin(), mu.end(), [](uint32_t x) { return x == 1; })) {
        I value = hook_length_dimension<I>(lambda);
        cache.insert(lambda, mu, value);
        return value;
    }

    // Murnaghan-Nakayama: remove every rim hook of length mu[0].
    const uint32_t k = mu[0];
    const partition rest(std::vector<uint32_t>(mu.begin() + 1, mu.end()));
    auto strip = border_strip(lambda);
    I value = 0;
    for(uint32_t i = 0; i + k <= strip.size(); ++i) {
        if(not is_rim_hook(strip, i, k)) {
            continue;
        }
        I augment = _character_value_impl<I>(remove_rim_hook(lambda, strip, i, k), rest, cache);
        uint32_t height = std::get<0>(strip[i]) - std::get<0>(strip[i + k - 1]);
        if(height % 2) {
            value -= augment;
        } else {
            value += augment;
        }
    }
    cache.insert(lambda, mu, value);
    return value;
}

// chi^lambda at a permutation of cycle type mu.
template<typename I = default_value>
I character_value(const partition& lambda, const partition& mu) {
    if(lambda.weight() != mu.weight()) {
        std::ostringstream msg;
        msg << "character value: |" << partition_string(lambda) << "| != |" << partition_string(mu) << "|";
        throw invalid_input(msg.str());
    }
    auto& cache = character_cache<I>::instance();
    I value = _character_value_impl<I>(lambda, mu, cache);
    if(debug.is_open()) {
        print_partition(print_partition(debug << "chi ", lambda) << " at ", mu) << " = " << value
            << ", cache size " << cache.size() << ", RAM usage: " << get_used_RAM() << "MB" << std::endl;
    }
    return value;
}
