/* -- C++ -- */
/**
 *  @file  tests/test_hdf5_reader.cpp
 *
 *  @brief Reading eveH5 style datasets and attributes, and loading a scan
 *         through a catalog on disk.
 */

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <H5Cpp.h>

#include "CatalogIO.hh"
#include "DataFields.hh"
#include "Hdf5Reader.hh"
#include "JoinService.hh"
#include "util/TestCheck.hh"

using namespace eve;

namespace
{

struct AxisRow
{
    std::int32_t position;
    double value;
    char state[8];
};

struct ChannelRow
{
    std::int32_t position;
    float value;
};

void write_text_attribute(H5::H5Object &object, const std::string &name, const std::string &value)
{
    H5::StrType type(H5::PredType::C_S1, value.size());
    H5::Attribute attr = object.createAttribute(name, type, H5::DataSpace(H5S_SCALAR));
    attr.write(type, value);
}

std::filesystem::path write_scan(const std::filesystem::path &dir)
{
    const std::filesystem::path path = dir / "scan.h5";
    H5::H5File file(path.string(), H5F_ACC_TRUNC);
    H5::Group c1 = file.createGroup("/c1");
    H5::Group main_group = file.createGroup("/c1/main");
    write_text_attribute(c1, "EVEH5Version", "7");

    const AxisRow axis_rows[3] = {{3, 1.5, "open"}, {1, 0.5, "closed"}, {3, 2.5, "open"}};
    H5::CompType axis_type(sizeof(AxisRow));
    axis_type.insertMember("PosCounter", HOFFSET(AxisRow, position), H5::PredType::NATIVE_INT32);
    axis_type.insertMember("SimMot:01", HOFFSET(AxisRow, value), H5::PredType::NATIVE_DOUBLE);
    axis_type.insertMember("State", HOFFSET(AxisRow, state), H5::StrType(H5::PredType::C_S1, sizeof(AxisRow::state)));
    hsize_t axis_dims[1] = {3};
    H5::DataSet axis = main_group.createDataSet("SimMot:01", axis_type, H5::DataSpace(1, axis_dims));
    axis.write(axis_rows, axis_type);
    write_text_attribute(axis, "Name", "motor");
    write_text_attribute(axis, "Unit", std::string("\xB5m"));
    const std::int32_t deadband = 2;
    H5::Attribute number = axis.createAttribute("Precision", H5::PredType::NATIVE_INT32, H5::DataSpace(H5S_SCALAR));
    number.write(H5::PredType::NATIVE_INT32, &deadband);

    const ChannelRow channel_rows[2] = {{1, 0.25f}, {2, 0.75f}};
    H5::CompType channel_type(sizeof(ChannelRow));
    channel_type.insertMember("PosCounter", HOFFSET(ChannelRow, position), H5::PredType::NATIVE_INT32);
    channel_type.insertMember("SimChan:01", HOFFSET(ChannelRow, value), H5::PredType::NATIVE_FLOAT);
    hsize_t channel_dims[1] = {2};
    H5::DataSet channel = main_group.createDataSet("SimChan:01", channel_type, H5::DataSpace(1, channel_dims));
    channel.write(channel_rows, channel_type);

    const std::vector<std::int64_t> counts{4, 5, 6, 7};
    hsize_t counts_dims[1] = {counts.size()};
    H5::DataSet simple = c1.createDataSet("counts", H5::PredType::NATIVE_INT64, H5::DataSpace(1, counts_dims));
    simple.write(counts.data(), H5::PredType::NATIVE_INT64);
    return path;
}

std::filesystem::path scratch_dir()
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "eve_test_hdf5_reader";
    std::filesystem::create_directories(dir);
    return dir;
}

int test_compound_datasets()
{
    const Hdf5Reader reader(write_scan(scratch_dir()).string());
    const RawTable axis = reader.read("/c1/main/SimMot:01");
    EVE_CHECK(axis.names == (std::vector<std::string>{"PosCounter", "SimMot:01", "State"}));
    EVE_CHECK(axis.rows() == 3);
    EVE_CHECK(axis.column("PosCounter").integers() == (std::vector<std::int64_t>{3, 1, 3}));
    EVE_CHECK(axis.column("SimMot:01").floats() == (std::vector<double>{1.5, 0.5, 2.5}));
    EVE_CHECK(axis.column("State").texts() == (std::vector<std::string>{"open", "closed", "open"}));

    const RawTable channel = reader.read("/c1/main/SimChan:01");
    EVE_CHECK(channel.column("SimChan:01").type() == Column::Type::kFloat);
    EVE_CHECK_NEAR(channel.column("SimChan:01").floats()[1], 0.75, 1e-9);

    const RawTable simple = reader.read("/c1/counts");
    EVE_CHECK(simple.names == (std::vector<std::string>{"counts"}));
    EVE_CHECK(simple.column("counts").integers().back() == 7);

    EVE_CHECK_THROWS(reader.read("/c1/nothere"), std::runtime_error);
    EVE_CHECK_THROWS(Hdf5Reader("/nonexistent/scan.h5").read("/c1"), std::runtime_error);
    return 0;
}

int test_attributes_and_listing()
{
    const Hdf5Reader reader(write_scan(scratch_dir()).string());
    const auto attrs = reader.attributes("/c1/main/SimMot:01");
    EVE_CHECK(attrs.at("Name") == "motor");
    EVE_CHECK(attrs.at("Unit") == "\xC2\xB5m");
    EVE_CHECK(attrs.at("Precision") == "2");
    EVE_CHECK(reader.attributes("/c1").at("EVEH5Version") == "7");
    EVE_CHECK(reader.attributes("/").empty());

    const std::vector<std::string> datasets = reader.list_datasets();
    EVE_CHECK(datasets == (std::vector<std::string>{"/c1/counts", "/c1/main/SimChan:01", "/c1/main/SimMot:01"}));
    return 0;
}

int test_text_decoding()
{
    bool fallback = true;
    EVE_CHECK(Hdf5Reader::decode_text("plain", &fallback) == "plain");
    EVE_CHECK(!fallback);
    EVE_CHECK(Hdf5Reader::decode_text("\xC3\xA9t\xC3\xA9", &fallback) == "\xC3\xA9t\xC3\xA9");
    EVE_CHECK(!fallback);
    EVE_CHECK(Hdf5Reader::decode_text("\xE9t\xE9", &fallback) == "\xC3\xA9t\xC3\xA9");
    EVE_CHECK(fallback);
    EVE_CHECK(Hdf5Reader::decode_text("\xC3", &fallback) == "\xC3\x83");
    EVE_CHECK(fallback);

    EVE_CHECK(Hdf5Reader::decode_text("\xE2\x82\xAC", &fallback) == "\xE2\x82\xAC");
    EVE_CHECK(!fallback);
    EVE_CHECK(Hdf5Reader::decode_text("\xF0\x9F\x98\x80", &fallback) == "\xF0\x9F\x98\x80");
    EVE_CHECK(!fallback);

    // Overlong, surrogate and out-of-range sequences are read as Latin-1.
    EVE_CHECK(Hdf5Reader::decode_text("\xE0\x80\xB5", &fallback) == "\xC3\xA0\xC2\x80\xC2\xB5");
    EVE_CHECK(fallback);
    EVE_CHECK(Hdf5Reader::decode_text("\xED\xA0\x80", &fallback) == "\xC3\xAD\xC2\xA0\xC2\x80");
    EVE_CHECK(fallback);
    EVE_CHECK(Hdf5Reader::decode_text("\xF0\x80\x80\x80", &fallback) == "\xC3\xB0\xC2\x80\xC2\x80\xC2\x80");
    EVE_CHECK(fallback);
    EVE_CHECK(Hdf5Reader::decode_text("\xF4\x90\x80\x80", &fallback) == "\xC3\xB4\xC2\x90\xC2\x80\xC2\x80");
    EVE_CHECK(fallback);
    return 0;
}

int test_catalog_on_disk()
{
    const std::filesystem::path dir = scratch_dir();
    write_scan(dir);
    const std::filesystem::path catalog = dir / "scan.json";
    {
        std::ofstream out(catalog);
        out << R"({
          "file": "scan.h5",
          "data": [
            {"kind": "axis", "id": "SimMot:01", "locator": "/c1/main/SimMot:01"},
            {"kind": "channel", "id": "SimChan:01", "locator": "/c1/main/SimChan:01"}
          ]
        })";
    }

    const ScanFile file = CatalogIO::read(catalog.string());
    EVE_CHECK(file.metadata.filename == (dir / "scan.h5").string() || file.metadata.filename == "scan.h5");
    const DataSet *axis = file.find_data("SimMot:01");
    EVE_CHECK(axis->metadata().name == "motor");
    EVE_CHECK(axis->index() == (std::vector<std::int64_t>{1, 3}));
    EVE_CHECK(axis->data().floats() == (std::vector<double>{0.5, 2.5}));

    const auto out = JoinService::align(&file, {"SimMot:01", "SimChan:01"}, JoinPolicy::kAxisOrChannelPositions);
    EVE_CHECK(out[0].index() == (std::vector<std::int64_t>{1, 2, 3}));
    EVE_CHECK(out[0].data().floats() == (std::vector<double>{0.5, 0.5, 2.5}));
    EVE_CHECK(out[1].data().is_masked(2));

    EVE_CHECK_THROWS(CatalogIO::read((dir / "missing.json").string()), std::runtime_error);
    return 0;
}

} // namespace

int main()
{
    EVE_RUN(test_compound_datasets);
    EVE_RUN(test_attributes_and_listing);
    EVE_RUN(test_text_decoding);
    EVE_RUN(test_catalog_on_disk);
    return 0;
}
