#include "swc/upload/service.hpp"

#include "swc/events/events.hpp"
#include "support/fake_transport.hpp"
#include "support/stub_node.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using swc::Config;
using swc::Error;
using swc::ErrorKind;
using swc::Ok;
using swc::Result;
using swc::metadata::MetadataStore;
using swc::metadata::RecordPatch;
using swc::test_support::FakeTransport;
using swc::test_support::run_until;
using swc::transport::TransferStatus;
using swc::upload::KnownTransfer;
using swc::upload::TransferListMonitor;
using swc::upload::UploadService;
namespace events = swc::events;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    auto dir = fs::temp_directory_path() /
               fs::path(prefix + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

TransferStatus tag(std::uint64_t uid) {
    TransferStatus status;
    status.uid = uid;
    status.split = 4;
    status.synced = uid % 2 == 0 ? 4 : 1;
    return status;
}

std::vector<TransferStatus> tags(std::uint64_t first, std::uint64_t count) {
    std::vector<TransferStatus> out;
    for (std::uint64_t uid = first; uid < first + count; ++uid) {
        out.push_back(tag(uid));
    }
    return out;
}

Config test_config(const fs::path& state_dir) {
    Config config;
    config.state_dir = state_dir;
    config.batch_id = "batch-1";
    config.poll_interval = 1ms;
    config.sync_poll_interval = 1ms;
    config.archive_dir = state_dir / "scratch";
    fs::create_directories(config.archive_dir);
    return config;
}

class UploadServiceTest : public ::testing::Test {
protected:
    boost::asio::io_context io;
    FakeTransport transport{io};
    fs::path state_dir = create_temp_dir("swc_service");
    UploadService service{io, transport, test_config(state_dir)};

    Result<std::vector<KnownTransfer>> list_now() {
        std::optional<Result<std::vector<KnownTransfer>>> result;
        service.list_known_transfers([&](Result<std::vector<KnownTransfer>> r) { result = std::move(r); });
        EXPECT_TRUE(run_until(io, [&] { return result.has_value(); }));
        if (!result) {
            return swc::Err<std::vector<KnownTransfer>>(ErrorKind::Unreachable, "timed out");
        }
        return std::move(*result);
    }
};

} // namespace

TEST_F(UploadServiceTest, ListWalksPagesUntilShortPage) {
    transport.list_pages = {tags(1, UploadService::kListPageSize), tags(1001, 2)};

    auto listed = list_now();
    ASSERT_TRUE(listed.is_ok());
    EXPECT_EQ(transport.list_offsets, (std::vector<std::size_t>{0, 1000}));
    ASSERT_EQ(listed.value().size(), 1002u);
    EXPECT_EQ(listed.value().front().status.uid, 1002u);
    EXPECT_EQ(listed.value().back().status.uid, 1u);
}

TEST_F(UploadServiceTest, ListJoinsLocalRecords) {
    transport.list_result = Ok(std::vector<TransferStatus>{tag(3), tag(9), tag(5)});
    MetadataStore store(service.config().uploads_db_path());
    ASSERT_TRUE(store.put(9, RecordPatch().name("photo.jpg").reference("aa")).is_ok());

    auto listed = list_now();
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value().size(), 3u);
    EXPECT_EQ(listed.value()[0].status.uid, 9u);
    ASSERT_TRUE(listed.value()[0].record.has_value());
    EXPECT_EQ(listed.value()[0].record->name, "photo.jpg");
    EXPECT_EQ(listed.value()[1].status.uid, 5u);
    EXPECT_FALSE(listed.value()[1].record.has_value());
    EXPECT_EQ(listed.value()[2].status.uid, 3u);
    EXPECT_EQ(transport.list_offsets, (std::vector<std::size_t>{0}));
}

TEST_F(UploadServiceTest, ListSurvivesCorruptRecordTable) {
    {
        std::ofstream out(service.config().uploads_db_path());
        out << "[[[";
    }
    transport.list_result = Ok(std::vector<TransferStatus>{tag(1)});

    auto listed = list_now();
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value().size(), 1u);
    EXPECT_FALSE(listed.value()[0].record.has_value());
}

TEST_F(UploadServiceTest, ListErrorIsPassedThrough) {
    transport.list_result = swc::Err<std::vector<TransferStatus>>(ErrorKind::Unreachable, "connection refused");

    auto listed = list_now();
    ASSERT_TRUE(listed.is_error());
    EXPECT_EQ(listed.error().kind, ErrorKind::Unreachable);
}

TEST_F(UploadServiceTest, StartedUploadIsRecorded) {
    {
        std::ofstream out(state_dir / "hello.txt");
        out << "hello";
    }
    service.set_current_dir(state_dir);

    auto session = service.start_file_upload("hello.txt");
    ASSERT_TRUE(run_until(io, [&] { return transport.payload_waiting(); }));

    auto record = service.get_record(42);
    ASSERT_TRUE(record.is_ok());
    ASSERT_TRUE(record.value().has_value());
    EXPECT_EQ(record.value()->name, "hello.txt");
    EXPECT_EQ(record.value()->batch_id, "batch-1");
    EXPECT_EQ(record.value()->size, 5u);

    auto unknown = service.get_record(7);
    ASSERT_TRUE(unknown.is_ok());
    EXPECT_FALSE(unknown.value().has_value());
}

TEST_F(UploadServiceTest, PreviewResolvesAgainstCurrentDir) {
    fs::create_directories(state_dir / "site");
    {
        std::ofstream out(state_dir / "site" / "index.html");
        out << "<p>x</p>";
    }
    service.set_current_dir(state_dir);

    auto manifest = service.preview("site");
    ASSERT_TRUE(manifest.is_ok());
    EXPECT_EQ(manifest.value().file_count(), 1u);
    EXPECT_EQ(manifest.value().total_size, 8u);
    EXPECT_TRUE(manifest.value().has_entry_point);
}

TEST_F(UploadServiceTest, SetBatchIdPersists) {
    ASSERT_TRUE(service.set_batch_id("fresh-batch").is_ok());
    EXPECT_EQ(service.config().batch_id, "fresh-batch");

    auto reloaded = swc::load_config(state_dir);
    ASSERT_TRUE(reloaded.is_ok());
    EXPECT_EQ(reloaded.value().batch_id, "fresh-batch");

    auto rejected = service.set_batch_id("");
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind, ErrorKind::PreconditionFailed);
    EXPECT_EQ(service.config().batch_id, "fresh-batch");
}

TEST_F(UploadServiceTest, MonitorReportsUnreachableOnceThenRecovers) {
    transport.list_result = swc::Err<std::vector<TransferStatus>>(ErrorKind::Unreachable, "connection refused");

    auto monitor = std::make_shared<TransferListMonitor>(io, service, 1ms);
    int unreachable = 0;
    int reachable = 0;
    std::optional<events::TransferListUpdatedEvent> update;
    monitor->events().subscribe<events::NodeUnreachableEvent>([&](const events::NodeUnreachableEvent&) {
        ++unreachable;
    });
    monitor->events().subscribe<events::NodeReachableEvent>([&](const events::NodeReachableEvent&) {
        ++reachable;
    });
    monitor->events().subscribe<events::TransferListUpdatedEvent>([&](const events::TransferListUpdatedEvent& e) {
        update = e;
    });

    monitor->start();
    ASSERT_TRUE(run_until(io, [&] { return transport.list_offsets.size() >= 4; }));
    EXPECT_EQ(unreachable, 1);
    EXPECT_FALSE(monitor->reachable());
    EXPECT_FALSE(update.has_value());

    transport.list_result = Ok(std::vector<TransferStatus>{tag(2), tag(8)});
    ASSERT_TRUE(run_until(io, [&] { return update.has_value(); }));
    EXPECT_EQ(reachable, 1);
    EXPECT_TRUE(monitor->reachable());
    ASSERT_EQ(update->transfers.size(), 2u);
    EXPECT_EQ(update->transfers[0].status.uid, 8u);
    EXPECT_FALSE(update->transfers[0].has_record);

    monitor->stop();
}

TEST_F(UploadServiceTest, MonitorIgnoresNonReachabilityErrors) {
    transport.list_result = swc::Err<std::vector<TransferStatus>>(ErrorKind::RemoteError, "HTTP 500");

    auto monitor = std::make_shared<TransferListMonitor>(io, service, 1ms);
    int unreachable = 0;
    monitor->events().subscribe<events::NodeUnreachableEvent>([&](const events::NodeUnreachableEvent&) {
        ++unreachable;
    });

    monitor->start();
    ASSERT_TRUE(run_until(io, [&] { return transport.list_offsets.size() >= 3; }));
    EXPECT_EQ(unreachable, 0);
    EXPECT_TRUE(monitor->reachable());
    monitor->stop();
}
