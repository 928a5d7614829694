// End-to-end against a running master and volume server, for example the
// pair started by scripts/start-weed-test.sh. Set WEED_TEST_MASTER to the
// master address (localhost:8333 for that script) to enable.
#include <gtest/gtest.h>
#include <cstdlib>
#include <string>

#include "core/Errors.hpp"
#include "core/master/MasterClient.hpp"
#include "core/volume/VolumeClient.hpp"

using namespace weed;

class LiveClusterTest : public ::testing::Test {
protected:
  void SetUp() override {
    const char* addr = std::getenv("WEED_TEST_MASTER");
    if (!addr || !*addr) GTEST_SKIP() << "WEED_TEST_MASTER not set";
    master_address = addr;
  }

  std::string master_address;
};

TEST_F(LiveClusterTest, UploadDownloadDelete) {
  const auto master = MasterClient::fromString(master_address);

  const AssignResult a = master.assign();
  EXPECT_EQ(a.count, 1u);
  EXPECT_EQ(FileId::parse(a.fid.toString()), a.fid);

  const auto volume = VolumeClient::fromLocation(a.location);
  const std::string data = "Hello World!";

  const StoreResult stored = volume.store(a.fid, data);
  EXPECT_EQ(stored.size, data.size());

  EXPECT_EQ(volume.fetchBytes(a.fid), data);

  const DeleteResult deleted = volume.remove(a.fid);
  EXPECT_GT(deleted.size, 0u);

  try {
    volume.fetchBytes(a.fid);
    FAIL() << "file still readable after delete";
  } catch (const WeedError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::FileNotFound);
  }
}

TEST_F(LiveClusterTest, UploadMultipart) {
  const auto master = MasterClient::fromString(master_address);
  const AssignResult a = master.assign();
  const auto volume = VolumeClient::fromLocation(a.location);

  const StoreResult stored =
      volume.storeForm(a.fid, {{"file", "Hello World!", "hello.txt", "text/plain"}});
  EXPECT_EQ(stored.size, 12u);

  EXPECT_EQ(volume.fetchBytes(a.fid).size(), 12u);
}

TEST_F(LiveClusterTest, LookupAssignedVolume) {
  const auto master = MasterClient::fromString(master_address);
  const AssignResult a = master.assign();

  const LookupResult found = master.lookup(a.fid);
  ASSERT_FALSE(found.locations.empty());
  EXPECT_FALSE(found.locations.front().url.empty());
}
