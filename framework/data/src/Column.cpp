/* -- C++ -- */
/**
 *  @file  data/src/Column.cpp
 *
 *  @brief Implementation of the masked value column.
 */

#include "Column.hh"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "Errors.hh"

namespace eve
{

namespace
{

template <typename T>
std::vector<T> gather(const std::vector<T> &in, const std::vector<std::size_t> &rows)
{
    std::vector<T> out;
    out.reserve(rows.size());
    for (const std::size_t row : rows)
    {
        out.push_back(in[row]);
    }
    return out;
}

template <typename T>
std::vector<T> gather_or_default(const std::vector<T> &in, const std::vector<std::ptrdiff_t> &rows)
{
    std::vector<T> out;
    out.reserve(rows.size());
    for (const std::ptrdiff_t row : rows)
    {
        out.push_back(row < 0 ? T{} : in[static_cast<std::size_t>(row)]);
    }
    return out;
}

// A mask without a single masked slot is dropped, so that has_mask() keeps
// meaning "at least one value is missing".
void normalise_mask(std::vector<char> &mask)
{
    const bool any = std::any_of(mask.begin(), mask.end(),
                                 [](char m)
                                 {
                                     return m != 0;
                                 });
    if (!any)
    {
        mask.clear();
    }
}

void check_row(std::size_t row, std::size_t size)
{
    if (row >= size)
    {
        throw std::out_of_range("Column row " + std::to_string(row) +
                                " out of range (size " + std::to_string(size) + ")");
    }
}

} // namespace

Column::Column() : m_values(std::vector<double>{}) {}

Column::Column(std::vector<std::int64_t> values) : m_values(std::move(values)) {}

Column::Column(std::vector<double> values) : m_values(std::move(values)) {}

Column::Column(std::vector<std::string> values) : m_values(std::move(values)) {}

Column::Column(Storage values, std::vector<char> mask)
    : m_values(std::move(values)), m_mask(std::move(mask))
{
    normalise_mask(m_mask);
}

Column Column::masked(Type type, std::size_t n)
{
    Storage values;
    switch (type)
    {
    case Type::kInteger:
        values = std::vector<std::int64_t>(n);
        break;
    case Type::kText:
        values = std::vector<std::string>(n);
        break;
    case Type::kFloat:
    default:
        values = std::vector<double>(n);
        break;
    }
    return Column(std::move(values), std::vector<char>(n, 1));
}

const char *Column::type_name(Type type)
{
    switch (type)
    {
    case Type::kInteger:
        return "integer";
    case Type::kText:
        return "text";
    case Type::kFloat:
    default:
        return "float";
    }
}

Column::Type Column::type() const noexcept
{
    return static_cast<Type>(m_values.index());
}

std::size_t Column::size() const noexcept
{
    return std::visit([](const auto &values) { return values.size(); }, m_values);
}

bool Column::is_masked(std::size_t row) const
{
    check_row(row, size());
    return !m_mask.empty() && m_mask[row] != 0;
}

std::size_t Column::masked_count() const noexcept
{
    return static_cast<std::size_t>(std::count_if(m_mask.begin(), m_mask.end(),
                                                  [](char m)
                                                  {
                                                      return m != 0;
                                                  }));
}

void Column::mask_at(std::size_t row)
{
    check_row(row, size());
    if (m_mask.empty())
    {
        m_mask.assign(size(), 0);
    }
    m_mask[row] = 1;
}

const std::vector<std::int64_t> &Column::integers() const
{
    if (const auto *values = std::get_if<std::vector<std::int64_t>>(&m_values))
    {
        return *values;
    }
    throw InvalidArgument(std::string("Column holds ") + type_name(type()) + " values, not integer");
}

const std::vector<double> &Column::floats() const
{
    if (const auto *values = std::get_if<std::vector<double>>(&m_values))
    {
        return *values;
    }
    throw InvalidArgument(std::string("Column holds ") + type_name(type()) + " values, not float");
}

const std::vector<std::string> &Column::texts() const
{
    if (const auto *values = std::get_if<std::vector<std::string>>(&m_values))
    {
        return *values;
    }
    throw InvalidArgument(std::string("Column holds ") + type_name(type()) + " values, not text");
}

double Column::as_double(std::size_t row) const
{
    if (is_masked(row))
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
    switch (type())
    {
    case Type::kInteger:
        return static_cast<double>(std::get<std::vector<std::int64_t>>(m_values)[row]);
    case Type::kFloat:
        return std::get<std::vector<double>>(m_values)[row];
    case Type::kText:
    default:
        throw InvalidArgument("Text column has no numeric value at row " + std::to_string(row));
    }
}

std::string Column::as_string(std::size_t row) const
{
    if (is_masked(row))
    {
        return "--";
    }
    switch (type())
    {
    case Type::kInteger:
        return std::to_string(std::get<std::vector<std::int64_t>>(m_values)[row]);
    case Type::kFloat:
    {
        std::ostringstream out;
        out << std::setprecision(12) << std::get<std::vector<double>>(m_values)[row];
        return out.str();
    }
    case Type::kText:
    default:
        return std::get<std::vector<std::string>>(m_values)[row];
    }
}

Column Column::take(const std::vector<std::size_t> &rows) const
{
    const std::size_t n = size();
    for (const std::size_t row : rows)
    {
        check_row(row, n);
    }

    Storage values = std::visit([&rows](const auto &in) -> Storage { return gather(in, rows); },
                                m_values);
    std::vector<char> mask;
    if (has_mask())
    {
        mask = gather(m_mask, rows);
    }
    return Column(std::move(values), std::move(mask));
}

Column Column::take_or_mask(const std::vector<std::ptrdiff_t> &rows) const
{
    const std::size_t n = size();
    std::vector<char> mask(rows.size(), 0);
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        if (rows[i] < 0)
        {
            mask[i] = 1;
            continue;
        }
        const auto row = static_cast<std::size_t>(rows[i]);
        check_row(row, n);
        if (has_mask() && m_mask[row] != 0)
        {
            mask[i] = 1;
        }
    }

    Storage values = std::visit([&rows](const auto &in) -> Storage { return gather_or_default(in, rows); },
                                m_values);
    return Column(std::move(values), std::move(mask));
}

Column Column::as_type(Type target) const
{
    if (target == type())
    {
        return *this;
    }
    if (target == Type::kFloat && type() == Type::kInteger)
    {
        const auto &in = std::get<std::vector<std::int64_t>>(m_values);
        std::vector<double> out(in.begin(), in.end());
        return Column(Storage(std::move(out)), m_mask);
    }
    throw InvalidArgument(std::string("Cannot convert ") + type_name(type()) +
                          " column to " + type_name(target));
}

Column Column::splice(const std::vector<std::size_t> &at, const Column &values) const
{
    if (at.size() != values.size())
    {
        throw InvalidArgument("Splice needs one insertion row per value (" +
                              std::to_string(at.size()) + " rows, " +
                              std::to_string(values.size()) + " values)");
    }
    const std::size_t n = size();
    for (const std::size_t row : at)
    {
        if (row > n)
        {
            throw InvalidArgument("Splice row " + std::to_string(row) +
                                  " beyond column size " + std::to_string(n));
        }
    }

    Type target = type();
    if (values.type() != target)
    {
        if (target == Type::kText || values.type() == Type::kText)
        {
            throw InvalidArgument(std::string("Cannot splice ") + type_name(values.type()) +
                                  " values into " + type_name(target) + " column");
        }
        target = Type::kFloat;
    }
    const Column base = as_type(target);
    const Column extra = values.as_type(target);

    Storage joined = base.m_values;
    std::visit(
        [&extra](auto &dst)
        {
            using Values = std::decay_t<decltype(dst)>;
            const auto &src = std::get<Values>(extra.m_values);
            dst.insert(dst.end(), src.begin(), src.end());
        },
        joined);

    std::vector<char> mask;
    if (base.has_mask() || extra.has_mask())
    {
        mask = base.has_mask() ? base.m_mask : std::vector<char>(n, 0);
        if (extra.has_mask())
        {
            mask.insert(mask.end(), extra.m_mask.begin(), extra.m_mask.end());
        }
        else
        {
            mask.insert(mask.end(), extra.size(), 0);
        }
    }
    const Column all(std::move(joined), std::move(mask));

    std::vector<std::size_t> order(at.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&at](std::size_t a, std::size_t b)
                     {
                         return at[a] < at[b];
                     });

    std::vector<std::size_t> rows;
    rows.reserve(n + at.size());
    std::size_t next = 0;
    for (std::size_t row = 0; row <= n; ++row)
    {
        while (next < order.size() && at[order[next]] == row)
        {
            rows.push_back(n + order[next]);
            ++next;
        }
        if (row < n)
        {
            rows.push_back(row);
        }
    }
    return all.take(rows);
}

bool Column::operator==(const Column &other) const
{
    if (type() != other.type() || size() != other.size())
    {
        return false;
    }
    for (std::size_t row = 0; row < size(); ++row)
    {
        const bool masked = is_masked(row);
        if (masked != other.is_masked(row))
        {
            return false;
        }
        if (masked)
        {
            continue;
        }
        const bool same = std::visit(
            [&other, row](const auto &values)
            {
                using Values = std::decay_t<decltype(values)>;
                return values[row] == std::get<Values>(other.m_values)[row];
            },
            m_values);
        if (!same)
        {
            return false;
        }
    }
    return true;
}

} // namespace eve
