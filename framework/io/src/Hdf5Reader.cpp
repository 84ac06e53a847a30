/* -- C++ -- */
/**
 *  @file  io/src/Hdf5Reader.cpp
 *
 *  @brief Implementation of the eveH5 reader on top of the HDF5 C++ API.
 */

#include "Hdf5Reader.hh"

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <H5Cpp.h>

#include "Log.hh"

namespace eve
{

namespace
{

bool valid_utf8(const std::string &s)
{
    std::size_t i = 0;
    while (i < s.size())
    {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t follow = 0;
        if (c < 0x80)
            follow = 0;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2)
            follow = 1;
        else if ((c & 0xF0) == 0xE0)
            follow = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4)
            follow = 3;
        else
            return false;

        if (i + follow >= s.size())
            return false;

        // Overlong forms, surrogates and code points above U+10FFFF.
        const unsigned char second = static_cast<unsigned char>(s[i + 1]);
        if ((c == 0xE0 && second < 0xA0) || (c == 0xED && second > 0x9F) ||
            (c == 0xF0 && second < 0x90) || (c == 0xF4 && second > 0x8F))
            return false;

        for (std::size_t k = 1; k <= follow; ++k)
        {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80)
                return false;
        }
        i += follow + 1;
    }
    return true;
}

std::string strip_nulls(const char *data, std::size_t size)
{
    std::size_t n = 0;
    while (n < size && data[n] != '\0')
        ++n;
    return std::string(data, n);
}

std::string join_path(const std::string &group, const std::string &name)
{
    return group == "/" ? "/" + name : group + "/" + name;
}

std::string base_name(const std::string &locator)
{
    const auto slash = locator.find_last_of('/');
    return slash == std::string::npos ? locator : locator.substr(slash + 1);
}

Column read_member(const H5::DataSet &dset, const H5::CompType &ctype, unsigned index, std::size_t n)
{
    const std::string name = ctype.getMemberName(index);
    switch (ctype.getMemberClass(index))
    {
    case H5T_INTEGER:
    {
        std::vector<std::int64_t> values(n);
        H5::CompType mtype(sizeof(std::int64_t));
        mtype.insertMember(name, 0, H5::PredType::NATIVE_INT64);
        if (n > 0)
            dset.read(values.data(), mtype);
        return Column(std::move(values));
    }
    case H5T_FLOAT:
    {
        std::vector<double> values(n);
        H5::CompType mtype(sizeof(double));
        mtype.insertMember(name, 0, H5::PredType::NATIVE_DOUBLE);
        if (n > 0)
            dset.read(values.data(), mtype);
        return Column(std::move(values));
    }
    case H5T_STRING:
    {
        const H5::StrType stored = ctype.getMemberStrType(index);
        std::vector<std::string> values;
        values.reserve(n);
        if (stored.isVariableStr())
        {
            H5::StrType stype(H5::PredType::C_S1, H5T_VARIABLE);
            H5::CompType mtype(sizeof(char *));
            mtype.insertMember(name, 0, stype);
            std::vector<char *> buffer(n, nullptr);
            if (n > 0)
            {
                dset.read(buffer.data(), mtype);
                for (const char *s : buffer)
                    values.emplace_back(s ? s : "");
                H5::DataSet::vlenReclaim(buffer.data(), mtype, dset.getSpace());
            }
        }
        else
        {
            const std::size_t width = stored.getSize();
            H5::StrType stype(H5::PredType::C_S1, width);
            H5::CompType mtype(width);
            mtype.insertMember(name, 0, stype);
            std::vector<char> buffer(n * width);
            if (n > 0)
                dset.read(buffer.data(), mtype);
            for (std::size_t i = 0; i < n; ++i)
                values.push_back(strip_nulls(buffer.data() + i * width, width));
        }
        return Column(std::move(values));
    }
    default:
        throw std::runtime_error("Hdf5Reader: unsupported type of member " + name);
    }
}

Column read_simple(const H5::DataSet &dset, std::size_t n)
{
    switch (dset.getTypeClass())
    {
    case H5T_INTEGER:
    {
        std::vector<std::int64_t> values(n);
        if (n > 0)
            dset.read(values.data(), H5::PredType::NATIVE_INT64);
        return Column(std::move(values));
    }
    case H5T_FLOAT:
    {
        std::vector<double> values(n);
        if (n > 0)
            dset.read(values.data(), H5::PredType::NATIVE_DOUBLE);
        return Column(std::move(values));
    }
    default:
        throw std::runtime_error("Hdf5Reader: unsupported dataset type");
    }
}

std::string attribute_text(const H5::Attribute &attr, const std::string &owner)
{
    const H5::DataSpace space = attr.getSpace();
    const hssize_t count = space.getSimpleExtentNpoints();
    std::ostringstream out;

    switch (attr.getTypeClass())
    {
    case H5T_STRING:
    {
        std::string raw;
        attr.read(attr.getStrType(), raw);
        bool fallback = false;
        std::string text = Hdf5Reader::decode_text(raw, &fallback);
        if (fallback)
        {
            log_warning("Hdf5Reader", "attribute " + attr.getName() + " of " + owner +
                                          " is not UTF-8, decoded as ISO-8859-1");
        }
        return text;
    }
    case H5T_INTEGER:
    {
        std::vector<std::int64_t> values(static_cast<std::size_t>(count));
        attr.read(H5::PredType::NATIVE_INT64, values.data());
        for (std::size_t i = 0; i < values.size(); ++i)
            out << (i ? " " : "") << values[i];
        return out.str();
    }
    case H5T_FLOAT:
    {
        std::vector<double> values(static_cast<std::size_t>(count));
        attr.read(H5::PredType::NATIVE_DOUBLE, values.data());
        out.precision(12);
        for (std::size_t i = 0; i < values.size(); ++i)
            out << (i ? " " : "") << values[i];
        return out.str();
    }
    default:
        log_debug("Hdf5Reader", "skipping attribute " + attr.getName() + " of " + owner);
        return "";
    }
}

std::map<std::string, std::string> object_attributes(const H5::H5Object &object, const std::string &owner)
{
    std::map<std::string, std::string> out;
    const int n = object.getNumAttrs();
    for (int i = 0; i < n; ++i)
    {
        const H5::Attribute attr = object.openAttribute(static_cast<unsigned>(i));
        out[attr.getName()] = attribute_text(attr, owner);
    }
    return out;
}

void collect_datasets(const H5::Group &group, const std::string &path, std::vector<std::string> &out)
{
    const hsize_t n = group.getNumObjs();
    for (hsize_t i = 0; i < n; ++i)
    {
        const std::string name = group.getObjnameByIdx(i);
        switch (group.childObjType(name))
        {
        case H5O_TYPE_GROUP:
            collect_datasets(group.openGroup(name), join_path(path, name), out);
            break;
        case H5O_TYPE_DATASET:
            out.push_back(join_path(path, name));
            break;
        default:
            break;
        }
    }
}

} // namespace

Hdf5Reader::Hdf5Reader(std::string path) : m_path(std::move(path))
{
    H5::Exception::dontPrint();
}

std::string Hdf5Reader::decode_text(const std::string &raw, bool *fallback)
{
    if (fallback)
        *fallback = false;
    if (valid_utf8(raw))
        return raw;

    if (fallback)
        *fallback = true;
    std::string out;
    out.reserve(raw.size() * 2);
    for (const char ch : raw)
    {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80)
        {
            out.push_back(ch);
        }
        else
        {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

RawTable Hdf5Reader::read(const std::string &locator) const
{
    try
    {
        H5::H5File file(m_path, H5F_ACC_RDONLY);
        const H5::DataSet dset = file.openDataSet(locator);
        const H5::DataSpace space = dset.getSpace();
        if (space.getSimpleExtentNdims() != 1)
        {
            throw std::runtime_error("Hdf5Reader: dataset " + locator + " in " + m_path +
                                     " is not one-dimensional");
        }
        hsize_t dims[1] = {0};
        space.getSimpleExtentDims(dims);
        const std::size_t n = static_cast<std::size_t>(dims[0]);

        RawTable table;
        if (dset.getTypeClass() == H5T_COMPOUND)
        {
            const H5::CompType ctype = dset.getCompType();
            const int members = ctype.getNmembers();
            for (int i = 0; i < members; ++i)
            {
                const unsigned index = static_cast<unsigned>(i);
                table.add(ctype.getMemberName(index), read_member(dset, ctype, index, n));
            }
        }
        else
        {
            table.add(base_name(locator), read_simple(dset, n));
        }

        log_debug("Hdf5Reader", "action=read locator=" + locator +
                                    " columns=" + std::to_string(table.names.size()) +
                                    " rows=" + std::to_string(n));
        return table;
    }
    catch (const H5::Exception &e)
    {
        throw std::runtime_error("Hdf5Reader: failed to read " + locator + " from " + m_path +
                                 ": " + e.getDetailMsg());
    }
}

std::map<std::string, std::string> Hdf5Reader::attributes(const std::string &locator) const
{
    try
    {
        H5::H5File file(m_path, H5F_ACC_RDONLY);
        if (locator.empty() || locator == "/")
        {
            return object_attributes(file.openGroup("/"), "/");
        }
        if (file.childObjType(locator) == H5O_TYPE_GROUP)
        {
            return object_attributes(file.openGroup(locator), locator);
        }
        return object_attributes(file.openDataSet(locator), locator);
    }
    catch (const H5::Exception &e)
    {
        throw std::runtime_error("Hdf5Reader: failed to read attributes of " + locator +
                                 " from " + m_path + ": " + e.getDetailMsg());
    }
}

std::vector<std::string> Hdf5Reader::list_datasets() const
{
    try
    {
        H5::H5File file(m_path, H5F_ACC_RDONLY);
        std::vector<std::string> out;
        collect_datasets(file.openGroup("/"), "/", out);
        return out;
    }
    catch (const H5::Exception &e)
    {
        throw std::runtime_error("Hdf5Reader: failed to list " + m_path + ": " + e.getDetailMsg());
    }
}

} // namespace eve
