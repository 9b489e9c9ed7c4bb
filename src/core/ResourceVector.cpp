#include "ResourceVector.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ossim {

ResourceVector::ResourceVector(std::size_t width, int fill)
    : m_values(width, fill) {}

ResourceVector::ResourceVector(std::initializer_list<int> values)
    : m_values(values) {}

ResourceVector& ResourceVector::operator+=(const ResourceVector& other) {
    requireSameWidth(other);
    for (std::size_t i = 0; i < m_values.size(); ++i) {
        m_values[i] += other.m_values[i];
    }
    return *this;
}

ResourceVector& ResourceVector::operator-=(const ResourceVector& other) {
    requireSameWidth(other);
    for (std::size_t i = 0; i < m_values.size(); ++i) {
        m_values[i] -= other.m_values[i];
    }
    return *this;
}

bool ResourceVector::fitsWithin(const ResourceVector& other) const {
    requireSameWidth(other);
    for (std::size_t i = 0; i < m_values.size(); ++i) {
        if (m_values[i] > other.m_values[i]) {
            return false;
        }
    }
    return true;
}

bool ResourceVector::hasNegative() const {
    return std::any_of(m_values.begin(), m_values.end(),
                       [](int v) { return v < 0; });
}

void ResourceVector::requireSameWidth(const ResourceVector& other) const {
    if (m_values.size() != other.m_values.size()) {
        throw std::invalid_argument("resource vector width mismatch: " +
                                    std::to_string(m_values.size()) + " vs " +
                                    std::to_string(other.m_values.size()));
    }
}

ResourceVector operator+(ResourceVector lhs, const ResourceVector& rhs) {
    lhs += rhs;
    return lhs;
}

ResourceVector operator-(ResourceVector lhs, const ResourceVector& rhs) {
    lhs -= rhs;
    return lhs;
}

} // namespace ossim
