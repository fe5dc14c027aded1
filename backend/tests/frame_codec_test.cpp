#include "protocol/frame_codec.h"

#include <gtest/gtest.h>


TEST(FrameCodec, EncodesTextWithDelimiter) {
    EXPECT_EQ(FrameCodec::encode(TextFrame{"hello there"}), "hello there\n");
    EXPECT_EQ(FrameCodec::encode(TextFrame{""}), "\n");
}

TEST(FrameCodec, EncodesFileFrameWithPayloadAndNoTrailingDelimiter) {
    FileFrame original{FileHeader{std::nullopt, "a.txt", 2}, "hi"};
    EXPECT_EQ(FrameCodec::encode(original), "FILE_HEADER::a.txt::2\nhi");

    FileFrame relayed{FileHeader{std::string("bob"), "sub/b.txt", 3}, "bye"};
    EXPECT_EQ(FrameCodec::encode(relayed), "FILE_HEADER::bob::sub/b.txt::3\nbye");
}

TEST(FrameCodec, EncodesFolderFrames) {
    EXPECT_EQ(FrameCodec::encode(FolderHeaderFrame{std::nullopt, "photos"}), "FOLDER_HEADER::photos\n");
    EXPECT_EQ(FrameCodec::encode(FolderEndFrame{std::string("HOST"), "photos"}), "FOLDER_END::HOST::photos\n");
}

TEST(FrameCodec, DecodesClientOriginalsWithoutSender) {
    auto file = std::get<FileHeader>(FrameCodec::decode_header_line("FILE_HEADER::docs/report.pdf::1024"));
    EXPECT_FALSE(file.sender);
    EXPECT_EQ(file.relative_path, "docs/report.pdf");
    EXPECT_EQ(file.size, 1024u);

    auto folder = std::get<FolderHeaderFrame>(FrameCodec::decode_header_line("FOLDER_HEADER::docs"));
    EXPECT_FALSE(folder.sender);
    EXPECT_EQ(folder.name, "docs");
}

TEST(FrameCodec, DecodesRelayedFramesWithSender) {
    auto file = std::get<FileHeader>(FrameCodec::decode_header_line("FILE_HEADER::alice::a.txt::2"));
    ASSERT_TRUE(file.sender);
    EXPECT_EQ(*file.sender, "alice");
    EXPECT_EQ(file.relative_path, "a.txt");
    EXPECT_EQ(file.size, 2u);

    auto end = std::get<FolderEndFrame>(FrameCodec::decode_header_line("FOLDER_END::alice::docs"));
    ASSERT_TRUE(end.sender);
    EXPECT_EQ(*end.sender, "alice");
    EXPECT_EQ(end.name, "docs");
}

TEST(FrameCodec, ZeroSizeFileHeader) {
    auto file = std::get<FileHeader>(FrameCodec::decode_header_line("FILE_HEADER::empty.bin::0"));
    EXPECT_EQ(file.size, 0u);
}

TEST(FrameCodec, OtherLinesAreText) {
    auto text = std::get<TextFrame>(FrameCodec::decode_header_line("[alice] says: FILE_HEADER is a tag"));
    EXPECT_EQ(text.line, "[alice] says: FILE_HEADER is a tag");
    EXPECT_TRUE(std::holds_alternative<TextFrame>(FrameCodec::decode_header_line("FILE_HEADER")));
    EXPECT_TRUE(std::holds_alternative<TextFrame>(FrameCodec::decode_header_line("")));
}

TEST(FrameCodec, RejectsMalformedFileHeaders) {
    EXPECT_THROW(FrameCodec::decode_header_line("FILE_HEADER::a.txt"), FrameError);
    EXPECT_THROW(FrameCodec::decode_header_line("FILE_HEADER::a.txt::12x"), FrameError);
    EXPECT_THROW(FrameCodec::decode_header_line("FILE_HEADER::a.txt::-1"), FrameError);
    EXPECT_THROW(FrameCodec::decode_header_line("FILE_HEADER::a.txt::"), FrameError);
    EXPECT_THROW(FrameCodec::decode_header_line("FILE_HEADER::x::y::z::4"), FrameError);
    EXPECT_THROW(FrameCodec::decode_header_line("FILE_HEADER::::4"), FrameError);
    EXPECT_THROW(FrameCodec::decode_header_line("FILE_HEADER::a::99999999999999999999999"), FrameError);
}

TEST(FrameCodec, RejectsMalformedFolderFrames) {
    EXPECT_THROW(FrameCodec::decode_header_line("FOLDER_HEADER::"), FrameError);
    EXPECT_THROW(FrameCodec::decode_header_line("FOLDER_END::a::b::c"), FrameError);
}

TEST(FrameCodec, RejectsInvalidUtf8) {
    EXPECT_THROW(FrameCodec::decode_header_line("caf\xff"), FrameError);
    EXPECT_THROW(FrameCodec::decode_header_line("FOLDER_HEADER::\xc0\xaf"), FrameError);
}

TEST(FrameCodec, Utf8Validation) {
    EXPECT_TRUE(FrameCodec::is_valid_utf8("plain ascii"));
    EXPECT_TRUE(FrameCodec::is_valid_utf8("caf\xc3\xa9"));
    EXPECT_TRUE(FrameCodec::is_valid_utf8("\xe2\x82\xac"));
    EXPECT_TRUE(FrameCodec::is_valid_utf8("\xf0\x9f\x98\x80"));
    EXPECT_FALSE(FrameCodec::is_valid_utf8("\xc0\xaf"));          // overlong
    EXPECT_FALSE(FrameCodec::is_valid_utf8("\xed\xa0\x80"));      // surrogate
    EXPECT_FALSE(FrameCodec::is_valid_utf8("\xe2\x82"));          // truncated
    EXPECT_FALSE(FrameCodec::is_valid_utf8("\x80"));
    EXPECT_FALSE(FrameCodec::is_valid_utf8("\xf4\x90\x80\x80"));  // past U+10FFFF
}

TEST(FrameCodec, FileHeaderDetection) {
    EXPECT_TRUE(FrameCodec::is_file_header("FILE_HEADER::a::1"));
    EXPECT_FALSE(FrameCodec::is_file_header("FILE_HEADER"));
    EXPECT_FALSE(FrameCodec::is_file_header("FOLDER_HEADER::a"));
}
