#pragma once

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <gmpxx.h>

using default_value = mpz_class;


// Raised on size mismatches and on malformed partitions.
class invalid_input : public std::invalid_argument {
public:
    explicit invalid_input(const std::string& what) : std::invalid_argument(what) { }
};

template<typename T>
std::ostream& print_partition(std::ostream& out, const std::vector<T>& p) {
    out << "[ ";
    for(auto x : p) {
        out << int(x) << " ";
    }
    return out << "]";
}

// Weakly decreasing positive parts, no trailing zeros; empty is the partition of 0.
class partition : public std::vector<uint32_t> {
public:
    partition() = default;
    partition(std::initializer_list<uint32_t> parts) : partition(std::vector<uint32_t>(parts)) { }
    explicit partition(std::vector<uint32_t> parts) : std::vector<uint32_t>(std::move(parts)) {
        for(uint32_t i = 0; i < size(); ++i) {
            if((*this)[i] == 0 or (i > 0 and (*this)[i] > (*this)[i - 1])) {
                std::ostringstream msg;
                print_partition(msg << "not a partition: ", *this);
                throw invalid_input(msg.str());
            }
        }
    }

    uint32_t weight() const {
        return std::accumulate(begin(), end(), uint32_t(0));
    }
};

inline std::string partition_string(const partition& p) {
    std::ostringstream out;
    print_partition(out, p);
    return out.str();
}


// Column lengths of the diagram, found by walking a cursor up from the bottom row.
inline partition dual(const partition& p) {
    std::vector<uint32_t> ans;
    if(p.empty()) {
        return partition();
    }
    ans.reserve(p[0]);
    uint32_t cursor = p.size() - 1;
    for(uint32_t i = 1; i <= p[0]; ++i) {
        while(p[cursor] < i) {
            --cursor;
        }
        ans.push_back(cursor + 1);
    }
    return partition(std::move(ans));
}

template<typename I = default_value>
I factorial(uint32_t n) {
    I ans = 1;
    for(uint32_t j = 1; j <= n; ++j) {
        ans *= I(j);
    }
    return ans;
}

// Narrows an exact result to I; only the final value has to fit.
template<typename I>
I from_mpz(const mpz_class& x) {
    if constexpr(std::is_same_v<I, mpz_class>) {
        return x;
    } else {
        return I(x.get_si());
    }
}

// Dimension of the irreducible representation of S_n labelled by p.
template<typename I = default_value>
I hook_length_dimension(const partition& p) {
    if(p.empty()) {
        return I(1);
    }
    auto loc = dual(p);
    mpz_class prod = 1;
    for(uint32_t i = 0; i < p.size(); ++i) {
        for(uint32_t j = 0; j < p[i]; ++j) {
            prod *= p[i] - j + loc[j] - i - 1;
        }
    }
    mpz_class ans = factorial<mpz_class>(p.weight()) / prod;
    return from_mpz<I>(ans);
}

// z_mu = prod_j j^{m_j} m_j!, the order of the centralizer of a permutation of cycle type mu.
template<typename I = default_value>
I centralizer_order(const partition& mu) {
    mpz_class den = 1;
    std::vector<uint32_t> freq(mu.empty() ? 1 : mu[0] + 1);
    for(auto i : mu) {
        ++freq[i];
    }
    for(uint32_t j = 1; j < freq.size(); ++j) {
        for(uint32_t l = 1; l <= freq[j]; ++l) {
            den *= j * l;
        }
    }
    return from_mpz<I>(den);
}

template<typename I = default_value>
I conjugacy_class_size(const partition& mu) {
    mpz_class ans = factorial<mpz_class>(mu.weight()) / centralizer_order<mpz_class>(mu);
    return from_mpz<I>(ans);
}


using partitions = std::vector<partition>;

inline partitions generate_partitions(uint32_t n) {
    if(n == 0) {
        return {partition()};
    }
    std::vector<uint32_t> p(n + 1, 0);
    p[1] = n;
    std::vector<std::vector<uint32_t>> ans;
    uint32_t k = 1;
    while(k != 0) {
        uint32_t x = p[k - 1] + 1;
        uint32_t y = p[k] - 1;
        --k;
        while(x <= y) {
            p[k] = x;
            y -= x;
            ++k;
        }
        p[k] = x + y;
        ans.emplace_back(p.begin(), p.begin() + k + 1);
        std::reverse(ans.back().begin(), ans.back().end());
    }
    std::sort(ans.begin(), ans.end());
    partitions res;
    res.reserve(ans.size());
    for(auto& q : ans) {
        res.emplace_back(std::move(q));
    }
    return res;
}

inline auto partitions_table(uint32_t n) {
    std::vector<partitions> ans(n + 1);
    for(uint32_t k = 0; k <= n; ++k) {
        ans[k] = generate_partitions(k);
    }
    return ans;
}
