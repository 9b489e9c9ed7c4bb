#ifndef OSSIM_RESOURCE_VECTOR_HPP
#define OSSIM_RESOURCE_VECTOR_HPP

#include <cstddef>
#include <initializer_list>
#include <vector>

namespace ossim {

/**
 * Fixed-width vector of per-resource-type quantities. The width is set at
 * construction; arithmetic between vectors of different widths throws
 * std::invalid_argument.
 */
class ResourceVector {
public:
    ResourceVector() = default;
    explicit ResourceVector(std::size_t width, int fill = 0);
    ResourceVector(std::initializer_list<int> values);

    std::size_t width() const { return m_values.size(); }

    int operator[](std::size_t index) const { return m_values[index]; }
    int& operator[](std::size_t index) { return m_values[index]; }

    ResourceVector& operator+=(const ResourceVector& other);
    ResourceVector& operator-=(const ResourceVector& other);

    /** True when every component is <= the matching component of other. */
    bool fitsWithin(const ResourceVector& other) const;

    bool hasNegative() const;

    bool operator==(const ResourceVector& other) const { return m_values == other.m_values; }
    bool operator!=(const ResourceVector& other) const { return m_values != other.m_values; }

private:
    void requireSameWidth(const ResourceVector& other) const;

    std::vector<int> m_values;
};

ResourceVector operator+(ResourceVector lhs, const ResourceVector& rhs);
ResourceVector operator-(ResourceVector lhs, const ResourceVector& rhs);

} // namespace ossim

#endif // OSSIM_RESOURCE_VECTOR_HPP
