#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "factoradic.hpp"

using namespace std;

Factoradic::Factoradic(uint64_t n) {
    uint64_t factor = 1;
    do {
        digits.push_back(n % factor);
        n /= factor;
        ++factor;
    } while (n != 0);
}

Factoradic::Factoradic(const vector<uint64_t>& digits) : digits(digits) {
    for (size_t i = 0; i < digits.size(); ++i) {
        if (digits[i] > i) {
            throw invalid_argument("Factoradic digit " + to_string(i) + " must be at most " + to_string(i));
        }
    }
}

uint64_t Factoradic::to_integer() const {
    uint64_t value = 0;
    uint64_t place = 1;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 1) place *= i;
        value += digits[i] * place;
    }
    return value;
}

vector<uint64_t> Factoradic::to_rev_vec(size_t width) const {
    vector<uint64_t> out(digits.rbegin(), digits.rend());
    if (out.size() < width) {
        out.insert(out.begin(), width - out.size(), 0);
    }
    return out;
}

const vector<uint64_t>& Factoradic::get_digits() const {
    return digits;
}

Factoradic Factoradic::operator+(const Factoradic& other) const {
    if (digits.size() != other.digits.size()) {
        throw invalid_argument("Factoradic addition needs operands of equal length");
    }
    vector<uint64_t> out;
    uint64_t carry = 0;
    uint64_t radix = 1;
    for (size_t i = 0; i < digits.size(); ++i) {
        uint64_t sum = digits[i] + other.digits[i] + carry;
        out.push_back(sum % radix);
        carry = sum / radix;
        ++radix;
    }
    // remaining carry spills into new digits
    while (carry != 0) {
        out.push_back(carry % radix);
        carry /= radix;
        ++radix;
    }
    return Factoradic(out);
}

bool Factoradic::operator==(const Factoradic& rhs) const {
    return digits == rhs.digits;
}

ostream& operator<<(ostream& out, const Factoradic& value) {
    out << "Fact[";
    vector<uint64_t> rev = value.to_rev_vec();
    for (size_t i = 0; i < rev.size(); ++i) {
        if (i) out << ", ";
        out << rev[i];
    }
    return out << "]";
}

uint64_t factorial(unsigned n) {
    uint64_t ret = 1;
    while (n > 1) {
        ret *= n;
        --n;
    }
    return ret;
}

vector<int> nth_permutation(const vector<int>& items, uint64_t index) {
    if (index >= factorial(static_cast<unsigned>(items.size()))) {
        throw out_of_range("Permutation index " + to_string(index) + " out of range");
    }
    vector<int> pool = items;
    vector<uint64_t> lehmer = Factoradic(index).to_rev_vec(items.size());
    vector<int> out;
    out.reserve(items.size());
    for (uint64_t pick : lehmer) {
        out.push_back(pool[pick]);
        pool.erase(pool.begin() + static_cast<long>(pick));
    }
    return out;
}

uint64_t permutation_rank(const vector<int>& perm) {
    size_t n = perm.size();
    vector<bool> seen(n, false);
    for (int v : perm) {
        if (v < 0 || static_cast<size_t>(v) >= n || seen[v]) {
            throw invalid_argument("Not a permutation of 0..n-1");
        }
        seen[v] = true;
    }
    // digit for position i counts the smaller values still to its right
    vector<uint64_t> digits(n, 0);
    for (size_t i = 0; i < n; ++i) {
        uint64_t smaller = 0;
        for (size_t k = i + 1; k < n; ++k) {
            if (perm[k] < perm[i]) ++smaller;
        }
        digits[n - 1 - i] = smaller;
    }
    return Factoradic(digits).to_integer();
}
