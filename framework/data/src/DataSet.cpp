/* -- C++ -- */
/**
 *  @file  data/src/DataSet.cpp
 *
 *  @brief Implementation of deferred loading and cleaning of data objects.
 */

#include "DataSet.hh"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>

#include "DataFields.hh"
#include "Errors.hh"
#include "Log.hh"

namespace eve
{

namespace
{

std::vector<std::int64_t> to_index(const Column &column, const std::string &source)
{
    switch (column.type())
    {
    case Column::Type::kInteger:
        return column.integers();
    case Column::Type::kFloat:
    {
        const auto &values = column.floats();
        std::vector<std::int64_t> out;
        out.reserve(values.size());
        for (const double v : values)
        {
            out.push_back(static_cast<std::int64_t>(std::llround(v)));
        }
        return out;
    }
    case Column::Type::kText:
    default:
        throw std::runtime_error("Index column of " + source + " is not numeric");
    }
}

bool is_index_field(const std::string &name)
{
    return name == kPositionField || name == kMillisecondsField;
}

} // namespace

DataSet::DataSet(Kind kind) : m_kind(kind) {}

DataSet::DataSet(const DataSet &other)
{
    std::lock_guard<std::mutex> guard(other.m_mutex);
    m_kind = other.m_kind;
    m_channel_mode = other.m_channel_mode;
    m_normalized = other.m_normalized;
    m_metadata = other.m_metadata;
    m_importers = other.m_importers;
    m_loaded = other.m_loaded;
    m_index = other.m_index;
    m_field_names = other.m_field_names;
    m_fields = other.m_fields;
}

// A moved-from object is not shared, so moves take no lock.
DataSet::DataSet(DataSet &&other) noexcept
{
    m_kind = other.m_kind;
    m_channel_mode = other.m_channel_mode;
    m_normalized = other.m_normalized;
    m_metadata = std::move(other.m_metadata);
    m_importers = std::move(other.m_importers);
    m_loaded = other.m_loaded;
    m_index = std::move(other.m_index);
    m_field_names = std::move(other.m_field_names);
    m_fields = std::move(other.m_fields);
    other.m_loaded = false;
}

DataSet &DataSet::operator=(const DataSet &other)
{
    if (this == &other)
    {
        return *this;
    }
    std::scoped_lock lock(m_mutex, other.m_mutex);
    m_kind = other.m_kind;
    m_channel_mode = other.m_channel_mode;
    m_normalized = other.m_normalized;
    m_metadata = other.m_metadata;
    m_importers = other.m_importers;
    m_loaded = other.m_loaded;
    m_index = other.m_index;
    m_field_names = other.m_field_names;
    m_fields = other.m_fields;
    return *this;
}

DataSet &DataSet::operator=(DataSet &&other) noexcept
{
    if (this == &other)
    {
        return *this;
    }
    m_kind = other.m_kind;
    m_channel_mode = other.m_channel_mode;
    m_normalized = other.m_normalized;
    m_metadata = std::move(other.m_metadata);
    m_importers = std::move(other.m_importers);
    m_loaded = other.m_loaded;
    m_index = std::move(other.m_index);
    m_field_names = std::move(other.m_field_names);
    m_fields = std::move(other.m_fields);
    other.m_loaded = false;
    return *this;
}

void DataSet::set_channel_mode(ChannelMode mode, bool normalized)
{
    m_channel_mode = mode;
    m_normalized = normalized;
}

void DataSet::add_importer(DataImporter importer)
{
    std::lock_guard<std::mutex> guard(m_mutex);
    m_importers.push_back(std::move(importer));
    m_loaded = false;
}

void DataSet::ensure_loaded() const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_loaded)
    {
        return;
    }
    load_locked();
    m_loaded = true;
}

bool DataSet::is_loaded() const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_loaded;
}

void DataSet::load_locked() const
{
    std::vector<std::int64_t> index;
    std::vector<std::string> names;
    std::vector<Column> fields;
    bool has_index = false;

    for (const DataImporter &importer : m_importers)
    {
        log_debug("DataSet", "action=load id=" + m_metadata.id + " locator=" + importer.locator());
        RawTable table = importer.load();
        for (std::size_t i = 0; i < table.names.size(); ++i)
        {
            const std::string &name = table.names[i];
            if (is_index_field(name))
            {
                index = to_index(table.columns[i], importer.locator());
                has_index = true;
                continue;
            }
            const auto it = std::find(names.begin(), names.end(), name);
            if (it != names.end())
            {
                fields[static_cast<std::size_t>(it - names.begin())] = std::move(table.columns[i]);
            }
            else
            {
                names.push_back(name);
                fields.push_back(std::move(table.columns[i]));
            }
        }
    }

    if (!m_importers.empty() && !has_index)
    {
        throw std::runtime_error("No " + index_name() + " column mapped for " + label());
    }

    // "data" always leads the field list.
    const auto data_it = std::find(names.begin(), names.end(), kDataField);
    if (data_it != names.end() && data_it != names.begin())
    {
        const auto pos = static_cast<std::size_t>(data_it - names.begin());
        std::rotate(names.begin(), names.begin() + static_cast<std::ptrdiff_t>(pos),
                    names.begin() + static_cast<std::ptrdiff_t>(pos) + 1);
        std::rotate(fields.begin(), fields.begin() + static_cast<std::ptrdiff_t>(pos),
                    fields.begin() + static_cast<std::ptrdiff_t>(pos) + 1);
    }

    m_index = std::move(index);
    m_field_names = std::move(names);
    m_fields = std::move(fields);

    check_shape_locked();
    if (traits().sorted_on_load)
    {
        clean_locked();
    }
}

void DataSet::clean_locked() const
{
    const std::size_t n = m_index.size();
    if (n == 0)
    {
        return;
    }

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [this](std::size_t a, std::size_t b)
                     {
                         return m_index[a] < m_index[b];
                     });

    const DuplicateRule rule = traits().duplicates;
    std::vector<std::size_t> rows;
    rows.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        const std::int64_t position = m_index[order[i]];
        bool keep = true;
        if (rule == DuplicateRule::kKeepFirst)
        {
            keep = (i == 0) || m_index[order[i - 1]] != position;
        }
        else
        {
            keep = (i + 1 == n) || m_index[order[i + 1]] != position;
        }
        if (keep)
        {
            rows.push_back(order[i]);
        }
    }

    const bool identity = rows.size() == n && std::is_sorted(order.begin(), order.end());
    if (identity)
    {
        return;
    }
    if (rows.size() != n)
    {
        log_debug("DataSet", "action=clean id=" + m_metadata.id +
                                 " dropped_duplicates=" + std::to_string(n - rows.size()));
    }

    std::vector<std::int64_t> index;
    index.reserve(rows.size());
    for (const std::size_t row : rows)
    {
        index.push_back(m_index[row]);
    }
    m_index = std::move(index);
    for (Column &column : m_fields)
    {
        column = column.take(rows);
    }
}

void DataSet::check_shape_locked() const
{
    for (std::size_t i = 0; i < m_fields.size(); ++i)
    {
        if (m_fields[i].size() != m_index.size())
        {
            throw InvalidArgument("Field " + m_field_names[i] + " of " + label() + " has " +
                                  std::to_string(m_fields[i].size()) + " values for " +
                                  std::to_string(m_index.size()) + " index entries");
        }
    }
}

const std::vector<std::int64_t> &DataSet::index() const
{
    ensure_loaded();
    return m_index;
}

const Column &DataSet::data() const
{
    return field(kDataField);
}

const Column &DataSet::field(const std::string &name) const
{
    ensure_loaded();
    const auto it = std::find(m_field_names.begin(), m_field_names.end(), name);
    if (it == m_field_names.end())
    {
        throw InvalidArgument("No field " + name + " in " + label());
    }
    return m_fields[static_cast<std::size_t>(it - m_field_names.begin())];
}

bool DataSet::has_field(const std::string &name) const
{
    ensure_loaded();
    return std::find(m_field_names.begin(), m_field_names.end(), name) != m_field_names.end();
}

std::vector<std::string> DataSet::field_names() const
{
    ensure_loaded();
    return m_field_names;
}

std::size_t DataSet::size() const
{
    ensure_loaded();
    return m_index.size();
}

const Column &DataSet::mean() const
{
    if (m_kind != Kind::kChannel || m_channel_mode == ChannelMode::kSinglePoint)
    {
        throw InvalidArgument("Only average and interval channels provide mean values: " + label());
    }
    return data();
}

void DataSet::assign(std::vector<std::int64_t> index,
                     std::vector<std::pair<std::string, Column>> fields)
{
    std::lock_guard<std::mutex> guard(m_mutex);
    std::vector<std::string> names;
    std::vector<Column> columns;
    names.reserve(fields.size());
    columns.reserve(fields.size());
    for (auto &entry : fields)
    {
        if (entry.second.size() != index.size())
        {
            throw InvalidArgument("Field " + entry.first + " has " + std::to_string(entry.second.size()) +
                                  " values for " + std::to_string(index.size()) + " index entries");
        }
        names.push_back(std::move(entry.first));
        columns.push_back(std::move(entry.second));
    }
    m_index = std::move(index);
    m_field_names = std::move(names);
    m_fields = std::move(columns);
    m_loaded = true;
}

std::int64_t DataSet::position_at(double milliseconds) const
{
    return positions_at(std::vector<double>{milliseconds}).front();
}

std::vector<std::int64_t> DataSet::positions_at(const std::vector<double> &milliseconds) const
{
    if (m_kind != Kind::kTimestamp)
    {
        throw InvalidArgument("Positions can only be looked up in a timestamp table, not in " + label());
    }
    const Column &times = data();
    const std::vector<std::int64_t> &positions = index();
    if (positions.empty())
    {
        throw MissingDependency("Timestamp table is empty");
    }

    std::vector<double> recorded;
    recorded.reserve(times.size());
    for (std::size_t i = 0; i < times.size(); ++i)
    {
        recorded.push_back(times.as_double(i));
    }

    std::vector<std::int64_t> out;
    out.reserve(milliseconds.size());
    for (double time : milliseconds)
    {
        if (time < 0)
        {
            time = recorded.front();
        }
        auto k = static_cast<std::size_t>(std::upper_bound(recorded.begin(), recorded.end(), time) -
                                          recorded.begin());
        if (k == 0)
        {
            k = 1;
        }
        out.push_back(positions[k - 1]);
    }
    return out;
}

std::string DataSet::index_name() const
{
    return traits().position_indexed ? kPositionField : kMillisecondsField;
}

std::string DataSet::label() const
{
    std::ostringstream out;
    out << m_metadata.name;
    if (m_kind != Kind::kTimestamp)
    {
        out << " (" << m_metadata.id << ")";
    }
    out << " <" << kind_name(m_kind) << ">";
    return out.str();
}

std::string DataSet::describe() const
{
    std::ostringstream out;
    out << "METADATA\n"
        << m_metadata.to_string(m_kind, m_channel_mode, m_normalized) << "\n";

    out << "\nFIELDS\n" << index_name() << "\n";
    for (const std::string &name : value_fields(m_kind, m_channel_mode, m_normalized))
    {
        out << name << "\n";
    }
    return out.str();
}

} // namespace eve
