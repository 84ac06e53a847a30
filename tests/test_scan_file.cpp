/* -- C++ -- */
/**
 *  @file  tests/test_scan_file.cpp
 *
 *  @brief Scan file facade: file metadata, log messages, lookups.
 */

#include <string>
#include <vector>

#include "Errors.hh"
#include "Metadata.hh"
#include "ScanFile.hh"
#include "util/Fixtures.hh"
#include "util/TestCheck.hh"

using namespace eve;

namespace
{

int test_log_message_round_trip()
{
    const std::string line = "2024-03-01T12:34:56: Scan started: take 2";
    const LogMessage message = LogMessage::from_string(line);
    EVE_CHECK(message.timestamp == "2024-03-01T12:34:56");
    EVE_CHECK(message.message == "Scan started: take 2");
    EVE_CHECK(message.to_string() == line);

    EVE_CHECK_THROWS(LogMessage::from_string("no separator"), InvalidArgument);
    EVE_CHECK_THROWS(LogMessage::from_string("yesterday: something"), InvalidArgument);
    return 0;
}

int test_file_metadata_listing()
{
    FileMetadata meta;
    meta.filename = "scan.h5";
    meta.simulation = true;
    const std::string text = meta.to_string();
    EVE_CHECK(text.find("                       filename: scan.h5") != std::string::npos);
    EVE_CHECK(text.find("simulation: True") != std::string::npos);
    EVE_CHECK(text.find("preferred_normalisation_channel: ") != std::string::npos);
    return 0;
}

int test_device_metadata_listing()
{
    Metadata meta;
    meta.name = "motor";
    meta.id = "SimMot:01";
    meta.unit = "mm";
    meta.deadband = 0.5;
    meta.options["Speed"] = "10";

    const std::string axis = meta.to_string(Kind::kAxis);
    EVE_CHECK(axis.find("deadband: 0.5") != std::string::npos);
    EVE_CHECK(axis.find("\n\nSCALAR OPTIONS\nSpeed: 10") != std::string::npos);

    const std::string channel = meta.to_string(Kind::kChannel, ChannelMode::kAverage);
    EVE_CHECK(channel.find("deadband") == std::string::npos);
    EVE_CHECK(channel.find("n_averages: 0") != std::string::npos);
    EVE_CHECK(meta.to_string(Kind::kTimestamp).find("id:") == std::string::npos);
    return 0;
}

int test_lookups_and_preferred_data()
{
    ScanFile file;
    file.data.emplace("a", test::make_floats(Kind::kAxis, "a", {1}, {1}));
    file.data.emplace("c", test::make_floats(Kind::kChannel, "c", {1}, {1}));
    file.snapshots.emplace("a", test::make_floats(Kind::kAxis, "a", {0}, {0}));
    file.metadata.preferred_axis = "a";
    file.metadata.preferred_channel = "gone";

    EVE_CHECK(file.find_data("a") != nullptr);
    EVE_CHECK(file.find_data("x") == nullptr);
    EVE_CHECK(file.find_snapshot("a")->index().front() == 0);
    EVE_CHECK(file.find_monitor("a") == nullptr);
    EVE_CHECK(file.preferred_data() == (std::vector<std::string>{"a"}));

    file.metadata.preferred_channel = "c";
    EVE_CHECK(file.preferred_data() == (std::vector<std::string>{"a", "c"}));
    return 0;
}

} // namespace

int main()
{
    EVE_RUN(test_log_message_round_trip);
    EVE_RUN(test_file_metadata_listing);
    EVE_RUN(test_device_metadata_listing);
    EVE_RUN(test_lookups_and_preferred_data);
    return 0;
}
