#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "../SourceScanner.hpp"
#include "FakeMetadataProbe.hpp"

namespace fs = std::filesystem;
using namespace std::chrono;

class SourceScannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir = fs::temp_directory_path() /
               (std::string("camera_sorter_") + info->test_suite_name() +
                "_" + info->name());
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir, ec);
  }

  fs::path CreateDummyFile(const fs::path& relative_path) {
    fs::path full_path = test_dir / relative_path;
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

  static std::vector<std::string> Names(const std::vector<MediaFile>& files) {
    std::vector<std::string> names;
    for (const auto& f : files) names.push_back(f.source.filename().string());
    return names;
  }

  Config config;
  FileClassifier classifier{config};
  fs::path test_dir;
};

TEST_F(SourceScannerTest, ScansRecursivelyAndSkipsHiddenAndUnderscoreFiles) {
  CreateDummyFile("IMG_0001.JPG");
  CreateDummyFile("DCIM/100CANON/IMG_0002.CR2");
  CreateDummyFile("DCIM/100CANON/.IMG_0002.CR2");
  CreateDummyFile("DCIM/_thumb.jpg");
  CreateDummyFile("PRIVATE/clip.MP4");
  CreateDummyFile("notes.txt");

  SourceScanner scanner(classifier);
  std::vector<MediaFile> files = scanner.scan(test_dir);

  auto names = Names(files);
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"IMG_0001.JPG", "IMG_0002.CR2",
                                             "clip.MP4", "notes.txt"}));

  auto clip = std::find_if(files.begin(), files.end(), [](const MediaFile& f) {
    return f.source.filename() == "clip.MP4";
  });
  ASSERT_NE(clip, files.end());
  EXPECT_EQ(clip->kind, MediaKind::VIDEO);
  EXPECT_EQ(clip->extension, ".mp4");
}

TEST_F(SourceScannerTest, MissingSourceRootIsFatal) {
  SourceScanner scanner(classifier);

  EXPECT_THROW(scanner.scan(test_dir / "no_such_card"), fs::filesystem_error);
}

TEST_F(SourceScannerTest, SourceRootThatIsAFileIsFatal) {
  const fs::path file = CreateDummyFile("IMG_0001.JPG");
  SourceScanner scanner(classifier);

  EXPECT_THROW(scanner.scan(file), fs::filesystem_error);
}

TEST_F(SourceScannerTest, PhotoCandidatesContainOnlyPhotos) {
  CreateDummyFile("a.jpg");
  CreateDummyFile("b.nef");
  CreateDummyFile("c.mov");
  CreateDummyFile("d.txt");

  SourceScanner scanner(classifier);
  auto candidates = SourceScanner::photo_candidates(scanner.scan(test_dir));

  ASSERT_EQ(candidates.size(), 2u);
  EXPECT_EQ(candidates[0].filename(), "a.jpg");
  EXPECT_EQ(candidates[1].filename(), "b.nef");
}

TEST_F(SourceScannerTest, NoWindowKeepsEverythingWithoutProbing) {
  CreateDummyFile("a.jpg");
  CreateDummyFile("b.mov");
  FakeMetadataProbe probe;

  SourceScanner scanner(classifier);
  auto files =
      SourceScanner::filter_by_date(scanner.scan(test_dir), std::nullopt, probe);

  EXPECT_EQ(files.size(), 2u);
  EXPECT_EQ(probe.calls(), 0u);
}

TEST_F(SourceScannerTest, WindowUsesEmbeddedDateForPhotosAndMtimeOtherwise) {
  SetModificationDate(CreateDummyFile("in_by_exif.jpg"), 2020y / January / 1d);
  SetModificationDate(CreateDummyFile("out_by_exif.jpg"), 2024y / June / 2d);
  SetModificationDate(CreateDummyFile("in_by_mtime.jpg"), 2024y / June / 3d);
  SetModificationDate(CreateDummyFile("in_video.mov"), 2024y / June / 5d);
  SetModificationDate(CreateDummyFile("out_video.mov"), 2024y / June / 6d);

  FakeMetadataProbe probe;
  probe.set("in_by_exif.jpg",
            {.captured_at = local_days{2024y / June / 1d} + 8h});
  probe.set("out_by_exif.jpg",
            {.captured_at = local_days{2024y / May / 31d} + 23h});

  const DateWindow window{2024y / June / 1d, 2024y / June / 5d};
  SourceScanner scanner(classifier);
  auto files = SourceScanner::filter_by_date(scanner.scan(test_dir), window,
                                             probe);

  EXPECT_EQ(Names(files),
            (std::vector<std::string>{"in_by_exif.jpg", "in_by_mtime.jpg",
                                      "in_video.mov"}));
}
