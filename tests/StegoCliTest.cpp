#include "cli/StegoCli.hpp"
#include "TestFrames.hpp"

#include <gtest/gtest.h>
#include <map>
#include <sstream>

using namespace stegomotion;

namespace {

// Keeps clips in memory, bit-exact
class MemoryFrameStore : public FrameStore {
public:
  auto load(const std::string &path)
      -> std::expected<VideoClip, VideoIOError> override {
    auto it = clips.find(path);
    if (it == clips.end()) {
      return std::unexpected(VideoIOError::FileNotFound);
    }
    return it->second;
  }

  auto save(const std::string &path, const VideoClip &clip)
      -> std::expected<void, VideoIOError> override {
    clips[path] = clip;
    return {};
  }

  std::map<std::string, VideoClip> clips;
};

class StegoCliTest : public ::testing::Test {
protected:
  void addCover(const std::string &path, int frameCount) {
    store.clips[path] =
        VideoClip{test::makeNoiseFrames(frameCount, 8, 8, CV_8UC3), 25.0};
  }

  int runDialogue(const std::string &path, const std::string &input) {
    std::istringstream in(input);
    output.str("");
    StegoCli cli(config, engine, store, in, output);
    return cli.run(path);
  }

  bool printed(const std::string &text) const {
    return output.str().find(text) != std::string::npos;
  }

  AppConfig config;
  StegoEngine engine = StegoEngine::create().value();
  MemoryFrameStore store;
  std::ostringstream output;
};

} // namespace

TEST_F(StegoCliTest, HidesThenDetectsMessage) {
  addCover("cover.avi", 10);

  ASSERT_EQ(runDialogue("cover.avi", "H\nOK\nout.avi\n"), 0);
  EXPECT_TRUE(printed("You can enter a message up to 9 characters."));
  EXPECT_TRUE(printed("Message successfully hidden in out.avi."));
  ASSERT_EQ(store.clips.count("out.avi"), 1u);
  EXPECT_EQ(store.clips["out.avi"].fps, 25.0);

  ASSERT_EQ(runDialogue("out.avi", "D\n"), 0);
  EXPECT_TRUE(printed("Detected message: "));
  EXPECT_TRUE(printed("OK"));
}

TEST_F(StegoCliTest, Latin1CharactersSurviveTheDialogue) {
  addCover("cover.mov", 8);

  ASSERT_EQ(runDialogue("cover.mov", "h\ncaf\xC3\xA9\nout.mov\n"), 0);
  ASSERT_EQ(runDialogue("out.mov", "d\n"), 0);
  EXPECT_TRUE(printed("caf\xC3\xA9"));
}

TEST_F(StegoCliTest, RejectsUnsupportedContainer) {
  addCover("cover.mp4", 10);

  EXPECT_EQ(runDialogue("cover.mp4", "H\n"), 1);
  EXPECT_TRUE(printed("Only .avi and .mov files are supported."));
}

TEST_F(StegoCliTest, RejectsUnknownMode) {
  addCover("cover.avi", 10);

  EXPECT_EQ(runDialogue("cover.avi", "X\n"), 1);
  EXPECT_TRUE(printed("Invalid mode!"));
}

TEST_F(StegoCliTest, RejectsMessageLongerThanVideo) {
  addCover("cover.avi", 3);

  EXPECT_EQ(runDialogue("cover.avi", "H\nABC\nout.avi\n"), 1);
  EXPECT_TRUE(printed("You can enter a message up to 2 characters."));
  EXPECT_TRUE(printed("Message is too long for the video!"));
  EXPECT_EQ(store.clips.count("out.avi"), 0u);
}

TEST_F(StegoCliTest, CapacityIsCappedByHeaderWidth) {
  addCover("cover.avi", 300);

  EXPECT_EQ(runDialogue("cover.avi", "H\n"), 1);
  EXPECT_TRUE(printed("You can enter a message up to 255 characters."));
  EXPECT_TRUE(printed("Input ended unexpectedly."));
}

TEST_F(StegoCliTest, RejectsCharactersOutsideSingleByteRange) {
  addCover("cover.avi", 10);

  EXPECT_EQ(runDialogue("cover.avi", "H\n\xC4\x80\nout.avi\n"), 1);
  EXPECT_TRUE(printed("outside the single-byte range"));
  EXPECT_EQ(store.clips.count("out.avi"), 0u);
}

TEST_F(StegoCliTest, ReportsMissingVideo) {
  EXPECT_EQ(runDialogue("missing.avi", "D\n"), 1);
  EXPECT_TRUE(printed("Video file not found"));
}

TEST_F(StegoCliTest, BlankCoverHasNoMessage) {
  store.clips["blank.avi"] =
      VideoClip{test::makeFrames(5, 8, 8, CV_8UC3), 25.0};

  EXPECT_EQ(runDialogue("blank.avi", "D\n"), 0);
  EXPECT_TRUE(printed("No message detected."));
}

TEST_F(StegoCliTest, CorruptHeaderIsReportedAsNoMessage) {
  auto frames = test::makeFrames(3, 8, 8, CV_8UC3);
  ASSERT_TRUE(writeLsbWord(frames[0], 0xFF, CodecConfig{}));
  store.clips["tampered.avi"] = VideoClip{frames, 25.0};

  EXPECT_EQ(runDialogue("tampered.avi", "D\n"), 1);
  EXPECT_TRUE(printed("No message detected."));
  EXPECT_TRUE(printed("inconsistent with the frame count"));
}

TEST(Utf8Test, DecodesMultiByteSequences) {
  auto text = decodeUtf8("a\xC3\xA9\xE2\x82\xAC");
  ASSERT_TRUE(text);
  EXPECT_EQ(*text, U"a\u00E9\u20AC");
}

TEST(Utf8Test, RejectsMalformedInput) {
  EXPECT_FALSE(decodeUtf8("\xC3"));
  EXPECT_FALSE(decodeUtf8("\x80"));
  EXPECT_FALSE(decodeUtf8("\xE2\x28\xA1"));
  // Overlong 'A' and '/', and an encoded surrogate
  EXPECT_FALSE(decodeUtf8("\xC1\x81"));
  EXPECT_FALSE(decodeUtf8("\xE0\x80\xAF"));
  EXPECT_FALSE(decodeUtf8("\xED\xA0\x80"));
  EXPECT_FALSE(decodeUtf8("\xF4\x90\x80\x80"));
}

TEST(Utf8Test, ConvertsLatin1ForDisplay) {
  EXPECT_EQ(latin1ToUtf8("caf\xE9"), "caf\xC3\xA9");
  EXPECT_EQ(latin1ToUtf8("plain"), "plain");
}
