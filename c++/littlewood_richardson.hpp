#pragma once

#include <cstdint>
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

constexpr uint32_t NO_CELL = uint32_t(-1);


// Cells of outer / inner as 1-indexed (row, column), in lattice word order:
// rows top to bottom, each row right to left.
class skew_shape {
public:
    using cell = std::tuple<uint32_t, uint32_t>;

    skew_shape(const partition& outer, const partition& inner) {
        uint32_t ctr = 0;
        for(uint32_t row = 0; row < outer.size(); ++row) {
            uint32_t offset = 0;
            if(row < inner.size()) {
                offset = inner[row];
            }
            for(uint32_t column = outer[row]; column > offset; --column) {
                cells.emplace_back(row + 1, column);
                positions[{row + 1, column}] = ctr++;
            }
        }
        right.resize(ctr);
        above.resize(ctr);
        for(uint32_t loc = 0; loc < ctr; ++loc) {
            const auto& [row, column] = cells[loc];
            right[loc] = position({row, column + 1});
            above[loc] = position({row - 1, column});
        }
    }

    uint32_t size() const {
        return cells.size();
    }
    const cell& operator [] (uint32_t loc) const {
        return cells[loc];
    }
    // NO_CELL when c is not in the shape.
    uint32_t position(const cell& c) const {
        auto it = positions.find(c);
        return it == positions.end() ? NO_CELL : it->second;
    }
    uint32_t right_of(uint32_t loc) const {
        return right[loc];
    }
    uint32_t above_of(uint32_t loc) const {
        return above[loc];
    }

private:
    std::vector<cell> cells;
    btree::btree_map<cell, uint32_t> positions;
    std::vector<uint32_t> right, above;
};

inline bool fits_inside(const partition& inner, const partition& outer) {
    for(uint32_t row = 0; row < inner.size(); ++row) {
        if(row >= outer.size() or inner[row] > outer[row]) {
            return false;
        }
    }
    return true;
}


// Depth-first filling of a skew shape by lattice words of the given weight.
template<typename F>
class lr_search {
public:
    lr_search(const partition& weight, const skew_shape& shape, F& f) :
        weight(weight), shape(shape), f(f), word(weight.weight()), weight_count(weight.size(), 0) { }

    uint64_t run() {
        fill(0);
        return found;
    }

private:
    const partition& weight;
    const skew_shape& shape;
    F& f;
    std::vector<uint32_t> word;
    std::vector<uint32_t> weight_count;
    uint64_t found = 0;

    void fill(uint32_t loc) {
        if(loc == word.size()) {
            ++found;
            f(static_cast<const std::vector<uint32_t>&>(word), shape);
            return;
        }
        uint32_t lower_bound = 0;
        uint32_t upper_bound = weight.size() - 1;
        if(shape.right_of(loc) != NO_CELL) {
            upper_bound = word[shape.right_of(loc)];
        }
        if(shape.above_of(loc) != NO_CELL) {
            lower_bound = word[shape.above_of(loc)] + 1;
        }
        for(uint32_t c = lower_bound; c <= upper_bound; ++c) {
            if(weight_count[c] == weight[c]) {
                continue;
            }
            if(c > 0 and weight_count[c] == weight_count[c - 1]) {
                continue;
            }
            word[loc] = c;
            ++weight_count[c];
            fill(loc + 1);
            --weight_count[c];
        }
    }
};

template<typename F>
uint64_t _lr_search_impl(const partition& p1, const partition& p2, const partition& p3, F& f) {
    if(p1.weight() + p2.weight() != p3.weight()) {
        std::ostringstream msg;
        msg << "LR coefficient: |" << partition_string(p1) << "| + |" << partition_string(p2)
            << "| != |" << partition_string(p3) << "|";
        throw invalid_input(msg.str());
    }
    // Containment is checked on p1 and p2 as given, before they are swapped.
    if(not fits_inside(p1, p3) or not fits_inside(p2, p3)) {
        return 0;
    }
    bool swapped = p2.weight() < p1.weight();
    const partition& weight = swapped ? p2 : p1;
    const partition& inner = swapped ? p1 : p2;

    skew_shape shape(p3, inner);
    if(not debug.is_open()) {
        return lr_search<F>(weight, shape, f).run();
    }
    print_partition(print_partition(debug << "LR search: ", p3) << " / ", inner) << ", word length " << weight.weight() << std::endl;
    timer::start("lr search");
    auto found = lr_search<F>(weight, shape, f).run();
    timer::end("lr search");
    return found;
}

// f(word, shape) for every LR lattice word of c^{p3}_{p1,p2}; the lighter of p1, p2 is the weight.
template<typename F>
uint64_t for_each_lr_word(const partition& p1, const partition& p2, const partition& p3, F f) {
    return _lr_search_impl(p1, p2, p3, f);
}

template<typename I = default_value>
I lr_coefficient(const partition& p1, const partition& p2, const partition& p3) {
    I count = 0;
    auto counter = [&](const std::vector<uint32_t>&, const skew_shape&) {
        ++count;
    };
    _lr_search_impl(p1, p2, p3, counter);
    return count;
}
