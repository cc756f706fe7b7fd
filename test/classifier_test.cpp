#include <gtest/gtest.h>

#include "../src/classifier/classifier.hpp"

TEST(classifier_test, extension_lookup) {
    EXPECT_EQ(classify_file("photo.jpg"), category_t::Photos);
    EXPECT_EQ(classify_file("IMG_0001.HEIC"), category_t::Photos);
    EXPECT_EQ(classify_file("movie.mkv"), category_t::Videos);
    EXPECT_EQ(classify_file("song.flac"), category_t::Audio);
    EXPECT_EQ(classify_file("report.pdf"), category_t::Documents);
    EXPECT_EQ(classify_file("backup.tar.gz"), category_t::Archives);
    EXPECT_EQ(classify_file("setup.exe"), category_t::Installers);
    EXPECT_EQ(classify_file("Tool.AppImage"), category_t::Installers);
}

TEST(classifier_test, media_type_wins) {
    // extension says photo, media type says video
    EXPECT_EQ(classify_file("clip.jpg", "video/mp4"), category_t::Videos);
    EXPECT_EQ(classify_file("Budget", "application/vnd.google-apps.spreadsheet"), category_t::Documents);
    EXPECT_EQ(classify_file("no_extension", "image/png"), category_t::Photos);
}

TEST(classifier_test, unknown_media_type_falls_back_to_extension) {
    EXPECT_EQ(classify_file("archive.zip", "application/octet-stream"), category_t::Archives);
    EXPECT_EQ(classify_file("song.mp3", ""), category_t::Audio);
}

TEST(classifier_test, unknown_is_other) {
    EXPECT_EQ(classify_file("notes"), category_t::Other);
    EXPECT_EQ(classify_file("data.xyz"), category_t::Other);
    EXPECT_EQ(classify_file("trailing."), category_t::Other);
    EXPECT_EQ(classify_file(""), category_t::Other);
    EXPECT_EQ(classify_file("blob", "application/x-unknown"), category_t::Other);
}

TEST(classifier_test, file_extension) {
    EXPECT_EQ(file_extension("a.JPG"), "jpg");
    EXPECT_EQ(file_extension("a.tar.gz"), "gz");
    EXPECT_EQ(file_extension("noext"), "");
    EXPECT_EQ(file_extension("dot."), "");
    EXPECT_EQ(file_extension("dir.d/file"), "");
}

TEST(classifier_test, category_names) {
    EXPECT_EQ(all_categories().size(), 7);
    EXPECT_EQ(all_categories().back(), category_t::Other);
    EXPECT_STREQ(category_name(category_t::Photos), "Photos");
    EXPECT_STREQ(category_name(category_t::Installers), "Installers");
    EXPECT_TRUE(is_date_bucketed(category_t::Photos));
    EXPECT_TRUE(is_date_bucketed(category_t::Videos));
    EXPECT_TRUE(is_date_bucketed(category_t::Documents));
    EXPECT_FALSE(is_date_bucketed(category_t::Audio));
    EXPECT_FALSE(is_date_bucketed(category_t::Other));
}
