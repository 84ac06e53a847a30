/* -- C++ -- */
/**
 *  @file  tests/test_table_export.cpp
 *
 *  @brief ROOT and text exports of aligned data.
 */

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <ROOT/RDataFrame.hxx>
#include <TFile.h>
#include <TNamed.h>

#include "DataFields.hh"
#include "Errors.hh"
#include "JoinService.hh"
#include "TableExportIO.hh"
#include "util/Fixtures.hh"
#include "util/TestCheck.hh"

using namespace eve;
using eve::test::make_floats;
using eve::test::make_set;

namespace
{

std::vector<DataSet> aligned_scan()
{
    DataSet axis = make_floats(Kind::kAxis, "SimMot:01", {2, 4}, {0.5, 1.5});
    axis.metadata().unit = "mm";
    const DataSet channel = make_floats(Kind::kChannel, "SimChan:01", {1, 2, 3}, {10, 20, 30});
    const DataSet shutter = make_set(Kind::kDevice, "Shutter", {1}, Column(std::vector<std::string>{"open"}));
    return JoinService::align({&axis, &channel, &shutter}, JoinPolicy::kAxisOrChannelPositions);
}

int test_branch_layout()
{
    EVE_CHECK(TableExportIO::sanitise_root_key("SimMot:01") == "SimMot_01");
    EVE_CHECK(TableExportIO::sanitise_root_key("") == "data");

    const std::vector<DataSet> aligned = aligned_scan();
    const auto layout = TableExportIO::layout(aligned);
    EVE_CHECK(layout.size() == 3);
    EVE_CHECK(layout[0].branch == "SimMot_01");
    EVE_CHECK(layout[0].unit == "mm");
    EVE_CHECK(layout[2].branch == "Shutter");
    return 0;
}

int test_tsv_marks_masked_cells()
{
    std::ostringstream out;
    const std::size_t rows = TableExportIO::write_tsv(aligned_scan(), out);
    EVE_CHECK(rows == 4);
    EVE_CHECK(out.str() ==
              "position\tSimMot_01\tSimChan_01\tShutter\n"
              "1\t--\t10\topen\n"
              "2\t0.5\t20\topen\n"
              "3\t0.5\t30\topen\n"
              "4\t1.5\t--\topen\n");
    return 0;
}

int test_root_round_trip()
{
    const std::string path = (std::filesystem::temp_directory_path() / "eve_test_table_export.root").string();
    EVE_CHECK(TableExportIO::write_root(aligned_scan(), path, "scan") == 4);

    ROOT::RDataFrame frame("scan", path);
    EVE_CHECK(*frame.Count() == 4);

    const auto positions = frame.Take<Long64_t>("position");
    EVE_CHECK(positions->size() == 4);
    EVE_CHECK(positions->at(0) == 1);
    EVE_CHECK(positions->at(3) == 4);

    const auto masked = frame.Take<bool>("SimMot_01_masked");
    EVE_CHECK(masked->at(0));
    EVE_CHECK(!masked->at(1));

    const auto values = frame.Take<double>("SimMot_01");
    EVE_CHECK(values->at(1) == 0.5);
    EVE_CHECK(values->at(3) == 1.5);

    const auto channel = frame.Filter("!SimChan_01_masked").Sum<double>("SimChan_01");
    EVE_CHECK(*channel == 60.0);

    const auto shutter = frame.Take<std::string>("Shutter");
    EVE_CHECK(shutter->at(2) == "open");

    std::unique_ptr<TFile> f(TFile::Open(path.c_str(), "READ"));
    EVE_CHECK(f && !f->IsZombie());
    const auto *unit = dynamic_cast<TNamed *>(f->Get("SimMot_01_unit"));
    EVE_CHECK(unit != nullptr);
    EVE_CHECK(std::string(unit->GetTitle()) == "mm");
    return 0;
}

int test_unaligned_input_rejected()
{
    const DataSet a = make_floats(Kind::kAxis, "a", {1, 2}, {1, 2});
    const DataSet b = make_floats(Kind::kAxis, "b", {1, 3}, {1, 2});
    std::ostringstream out;
    EVE_CHECK_THROWS(TableExportIO::write_tsv({a, b}, out), InvalidArgument);
    EVE_CHECK_THROWS(TableExportIO::write_tsv({}, out), InvalidArgument);
    return 0;
}

int test_colliding_branch_names_rejected()
{
    const DataSet colon = make_floats(Kind::kAxis, "a:b", {1}, {1});
    const DataSet underscore = make_floats(Kind::kAxis, "a_b", {1}, {2});
    EVE_CHECK_THROWS(TableExportIO::layout({colon, underscore}), InvalidArgument);

    DataSet interval = make_floats(Kind::kChannel, "x", {1}, {1});
    interval.assign({1}, {{kDataField, Column(std::vector<double>{1})}, {"std", Column(std::vector<double>{0.1})}});
    const DataSet other = make_floats(Kind::kChannel, "x_std", {1}, {5});
    EVE_CHECK_THROWS(TableExportIO::layout({interval, other}), InvalidArgument);

    std::ostringstream out;
    EVE_CHECK_THROWS(TableExportIO::write_tsv({interval, other}, out), InvalidArgument);
    EVE_CHECK(out.str().empty());

    const DataSet masked_name = make_floats(Kind::kChannel, "x_masked", {1}, {5});
    EVE_CHECK_THROWS(TableExportIO::layout({interval, masked_name}), InvalidArgument);
    EVE_CHECK_THROWS(TableExportIO::layout({make_floats(Kind::kChannel, "position", {1}, {5})}), InvalidArgument);

    EVE_CHECK(TableExportIO::layout({colon, make_floats(Kind::kChannel, "c", {1}, {3})}).size() == 2);
    return 0;
}

} // namespace

int main()
{
    EVE_RUN(test_branch_layout);
    EVE_RUN(test_tsv_marks_masked_cells);
    EVE_RUN(test_root_round_trip);
    EVE_RUN(test_unaligned_input_rejected);
    EVE_RUN(test_colliding_branch_names_rejected);
    return 0;
}
