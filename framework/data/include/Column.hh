/* -- C++ -- */
/**
 *  @file  data/include/Column.hh
 *
 *  @brief One-dimensional value column (integer, floating point, or text)
 *         with an optional parallel mask marking slots that carry no value.
 */

#ifndef EVE_DATA_COLUMN_H
#define EVE_DATA_COLUMN_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace eve
{

class Column
{
  public:
    enum class Type
    {
        kInteger,
        kFloat,
        kText
    };

    Column();
    explicit Column(std::vector<std::int64_t> values);
    explicit Column(std::vector<double> values);
    explicit Column(std::vector<std::string> values);

    static Column masked(Type type, std::size_t n);
    static const char *type_name(Type type);

    Type type() const noexcept;
    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

    /// True once the column uses the masked representation, i.e. at least
    /// one slot has been marked as carrying no value.
    bool has_mask() const noexcept { return !m_mask.empty(); }
    bool is_masked(std::size_t row) const;
    std::size_t masked_count() const noexcept;
    const std::vector<char> &mask() const noexcept { return m_mask; }
    void mask_at(std::size_t row);

    const std::vector<std::int64_t> &integers() const;
    const std::vector<double> &floats() const;
    const std::vector<std::string> &texts() const;

    double as_double(std::size_t row) const;
    std::string as_string(std::size_t row) const;

    /// Gather the given rows, in order.
    Column take(const std::vector<std::size_t> &rows) const;

    /// Gather the given rows; a negative row yields a masked slot.
    Column take_or_mask(const std::vector<std::ptrdiff_t> &rows) const;

    /**
     *  Insert @p values before the rows named in @p at (row numbers refer to
     *  this column before insertion; @p at equal to size() appends). Values
     *  sharing an insertion row keep their relative order.
     */
    Column splice(const std::vector<std::size_t> &at, const Column &values) const;

    bool operator==(const Column &other) const;
    bool operator!=(const Column &other) const { return !(*this == other); }

  private:
    using Storage = std::variant<std::vector<std::int64_t>,
                                 std::vector<double>,
                                 std::vector<std::string>>;

    Column(Storage values, std::vector<char> mask);

    Column as_type(Type type) const;

    Storage m_values;
    std::vector<char> m_mask;
};

} // namespace eve

#endif // EVE_DATA_COLUMN_H
