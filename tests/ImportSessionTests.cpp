#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "../ImportSession.hpp"
#include "FakeMetadataProbe.hpp"

namespace fs = std::filesystem;
using namespace std::chrono;

class ImportSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir = fs::temp_directory_path() /
               (std::string("camera_sorter_") + info->test_suite_name() +
                "_" + info->name());
    fs::remove_all(test_dir);
    source_dir = test_dir / "card";
    event_dir = test_dir / "event";
    fs::create_directories(source_dir);
    config.probe_threads = 2;
    config.transfer_threads = 2;
  }

  void TearDown() override {
    probe->release();
    std::error_code ec;
    fs::remove_all(test_dir, ec);
  }

  fs::path CreateDummyFile(const fs::path& relative_path) {
    fs::path full_path = source_dir / relative_path;
    if (full_path.has_parent_path()) {
      fs::create_directories(full_path.parent_path());
    }
    std::ofstream ofs(full_path);
    ofs << "dummy content";
    return full_path;
  }

  void SetModificationDate(const fs::path& path, year_month_day date) {
    fs::last_write_time(path, file_clock::from_sys(sys_days{date} + 12h));
  }

  ImportRequest Request(std::optional<DateWindow> window = std::nullopt) {
    return ImportRequest{source_dir, event_dir, "Jane Doe", window};
  }

  static IdentityPrompt Unexpected() {
    return []() -> std::string {
      ADD_FAILURE() << "identity prompt should not be used";
      return "unused";
    };
  }

  Config config;
  std::shared_ptr<FakeMetadataProbe> probe =
      std::make_shared<FakeMetadataProbe>();
  fs::path test_dir;
  fs::path source_dir;
  fs::path event_dir;
};

TEST_F(ImportSessionTest, SortsCardIntoEventLayout) {
  CreateDummyFile("DCIM/IMG_0001.JPG");
  CreateDummyFile("DCIM/sub/DSC_0002.nef");
  CreateDummyFile("DCIM/.IMG_0003.JPG");
  CreateDummyFile("DCIM/_IMG_0004.JPG");
  CreateDummyFile("PRIVATE/clip.MOV");
  CreateDummyFile("notes.txt");
  probe->set("IMG_0001.JPG", {.identity = "EOS R5"});
  ImportSession session(config, probe);

  std::atomic<std::size_t> progress_calls = 0;
  TransferSummary summary = session.run(
      Request(), Unexpected(),
      [&](const TransferOutcome&, std::size_t, std::size_t) {
        ++progress_calls;
      });

  const fs::path photos = event_dir / "Photography" / "EOS_R5_Jane_Doe";
  const fs::path videos = event_dir / "Videography" / "EOS_R5_Jane_Doe";
  EXPECT_TRUE(fs::exists(photos / "JPG" / "IMG_0001.JPG"));
  EXPECT_TRUE(fs::exists(photos / "NEF" / "DSC_0002.nef"));
  EXPECT_TRUE(fs::exists(videos / "MOV" / "clip.MOV"));
  EXPECT_FALSE(fs::exists(photos / "JPG" / ".IMG_0003.JPG"));
  EXPECT_FALSE(fs::exists(photos / "JPG" / "_IMG_0004.JPG"));
  EXPECT_TRUE(fs::is_directory(event_dir / "Graphics"));
  EXPECT_TRUE(fs::is_directory(event_dir / "Videography" / "EXPORT"));
  EXPECT_TRUE(fs::is_directory(event_dir / "Videography" / "Project Files"));
  EXPECT_TRUE(fs::is_directory(event_dir / "Videography" / "VFX + SFX Folder"));

  EXPECT_EQ(summary.succeeded, 3u);
  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.failed[0].source.filename(), "notes.txt");
  EXPECT_EQ(progress_calls.load(), 4u);
}

TEST_F(ImportSessionTest, AsksForIdentityWhenNoPhotoHasOne) {
  CreateDummyFile("IMG_0001.JPG");
  CreateDummyFile("clip.mp4");
  ImportSession session(config, probe);

  int prompts = 0;
  TransferSummary summary = session.run(Request(), [&] {
    ++prompts;
    return std::string("  GoPro Hero ");
  });

  EXPECT_EQ(prompts, 1);
  EXPECT_EQ(summary.succeeded, 2u);
  EXPECT_TRUE(fs::exists(event_dir / "Photography" / "GoPro_Hero_Jane_Doe" /
                         "JPG" / "IMG_0001.JPG"));
  EXPECT_TRUE(fs::exists(event_dir / "Videography" / "GoPro_Hero_Jane_Doe" /
                         "MP4" / "clip.mp4"));
}

TEST_F(ImportSessionTest, EmptyManualIdentityIsRejected) {
  CreateDummyFile("clip.mp4");
  ImportSession session(config, probe);

  EXPECT_THROW(session.run(Request(), [] { return std::string("   "); }),
               std::invalid_argument);
  EXPECT_FALSE(fs::exists(event_dir / "Videography"));
}

TEST_F(ImportSessionTest, StopWhileAskingForIdentityCancelsTheRun) {
  CreateDummyFile("clip.mp4");
  ImportSession session(config, probe);
  std::stop_source stop;

  TransferSummary summary;
  EXPECT_NO_THROW(summary = session.run(
                      Request(),
                      [&stop] {
                        stop.request_stop();
                        return std::string();
                      },
                      nullptr, stop.get_token()));

  EXPECT_EQ(summary.total(), 0u);
  EXPECT_FALSE(fs::exists(event_dir));
}

TEST_F(ImportSessionTest, UnreadableSourceIsFatal) {
  ImportSession session(config, probe);
  ImportRequest request = Request();
  request.source_root = test_dir / "missing_card";

  EXPECT_THROW(session.run(request, Unexpected()), fs::filesystem_error);
}

TEST_F(ImportSessionTest, DateWindowSelectsFilesToTransfer) {
  SetModificationDate(CreateDummyFile("IMG_0001.JPG"), 2020y / January / 1d);
  SetModificationDate(CreateDummyFile("IMG_0002.JPG"), 2024y / June / 2d);
  SetModificationDate(CreateDummyFile("clip_in.mov"), 2024y / June / 3d);
  SetModificationDate(CreateDummyFile("clip_out.mov"), 2024y / July / 3d);
  probe->set("IMG_0001.JPG", {.identity = "Z6",
                              .captured_at = local_days{2024y / June / 1d}});
  probe->set("IMG_0002.JPG", {.identity = "Z6",
                              .captured_at = local_days{2024y / July / 1d}});
  ImportSession session(config, probe);

  TransferSummary summary = session.run(
      Request(DateWindow{2024y / June / 1d, 2024y / June / 5d}), Unexpected());

  const fs::path photos = event_dir / "Photography" / "Z6_Jane_Doe";
  const fs::path videos = event_dir / "Videography" / "Z6_Jane_Doe";
  EXPECT_EQ(summary.succeeded, 2u);
  EXPECT_TRUE(summary.failed.empty());
  EXPECT_TRUE(fs::exists(photos / "JPG" / "IMG_0001.JPG"));
  EXPECT_FALSE(fs::exists(photos / "JPG" / "IMG_0002.JPG"));
  EXPECT_TRUE(fs::exists(videos / "MOV" / "clip_in.mov"));
  EXPECT_FALSE(fs::exists(videos / "MOV" / "clip_out.mov"));
}

TEST_F(ImportSessionTest, WindowRejectingEverythingStillCreatesGraphics) {
  SetModificationDate(CreateDummyFile("clip.mov"), 2024y / July / 3d);
  probe->set("IMG_0001.JPG", {.identity = "Z6"});
  SetModificationDate(CreateDummyFile("IMG_0001.JPG"), 2024y / July / 3d);
  ImportSession session(config, probe);

  TransferSummary summary = session.run(
      Request(DateWindow{2024y / June / 1d, 2024y / June / 1d}), Unexpected());

  EXPECT_EQ(summary.total(), 0u);
  EXPECT_TRUE(fs::is_directory(event_dir / "Graphics"));
  EXPECT_FALSE(fs::exists(event_dir / "Photography"));
  EXPECT_FALSE(fs::exists(event_dir / "Videography"));
}

TEST_F(ImportSessionTest, StopBeforeTransferCopiesNothing) {
  CreateDummyFile("IMG_0001.JPG");
  probe->set("IMG_0001.JPG", {.hang = true});
  ImportSession session(config, probe);
  std::stop_source stop;
  stop.request_stop();

  TransferSummary summary =
      session.run(Request(), Unexpected(), nullptr, stop.get_token());

  EXPECT_EQ(summary.total(), 0u);
  EXPECT_FALSE(fs::exists(event_dir));
}
