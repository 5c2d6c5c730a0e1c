#include "mime.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace swiv;
using swiv::test::TempDir;

TEST(Mime, DetectsPngFromContent) {
    TempDir tmp;
    MimeDetector mime;
    ASSERT_TRUE(mime.has_magic());

    // Misleading extension: libmagic looks at the bytes
    File file{tmp.write("picture.dat", swiv::test::tiny_png())};
    EXPECT_EQ(mime.mimetype(file), "image/png");
}

TEST(Mime, PngExtensionAndContent) {
    TempDir tmp;
    MimeDetector mime;
    File file{tmp.write("a.png", swiv::test::tiny_png())};
    EXPECT_EQ(mime.mimetype(file), "image/png");
}

TEST(Mime, NeverEmpty) {
    TempDir tmp;
    MimeDetector mime;
    File file{tmp.write("blob", swiv::test::pattern_bytes(512))};
    EXPECT_FALSE(mime.mimetype(file).empty());
}

TEST(Mime, ExtensionTable) {
    EXPECT_EQ(MimeDetector::from_extension("/a/b/photo.JPG"), "image/jpeg");
    EXPECT_EQ(MimeDetector::from_extension("x.webp"), "image/webp");
    EXPECT_EQ(MimeDetector::from_extension("/dir.d/noext"), "");
    EXPECT_EQ(MimeDetector::from_extension("archive.xyz"), "");
}
