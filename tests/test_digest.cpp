#include <gtest/gtest.h>
#include <platform/digest.hpp>
#include <platform/byte_stream.hpp>
#include <platform/platform.hpp>
#include <platform/durable_file.hpp>
#include <filesystem>

namespace fs = std::filesystem;

TEST(Sha256Digest, KnownVectors) {
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Digest, HexDoesNotDisturbAccumulator) {
    Sha256Digest d;
    d.update("ab", 2);
    std::string partial = d.hex();
    EXPECT_EQ(partial, sha256_hex("ab"));
    d.update("c", 1);
    EXPECT_EQ(d.hex(), sha256_hex("abc"));
}

TEST(Sha256Digest, StateSurvivesRestart) {
    // Split across a block boundary so both buffered and compressed state matter
    std::string payload(200, '\0');
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<char>(i * 7);

    std::string state;
    {
        Sha256Digest first;
        first.update(payload.data(), 77);
        state = first.save_state();
    }
    ASSERT_FALSE(state.empty());

    Sha256Digest resumed;
    ASSERT_TRUE(resumed.load_state(state));
    resumed.update(payload.data() + 77, payload.size() - 77);
    EXPECT_EQ(resumed.hex(), sha256_hex(payload));
}

TEST(Sha256Digest, EmptyStateResets) {
    Sha256Digest d;
    d.update("junk", 4);
    EXPECT_EQ(d.save_state().size() > 0, true);
    ASSERT_TRUE(d.load_state(""));
    EXPECT_EQ(d.hex(), sha256_hex(""));
    EXPECT_EQ(d.save_state(), "");
}

TEST(Sha256Digest, RejectsMalformedState) {
    Sha256Digest d;
    EXPECT_FALSE(d.load_state("md5:v1 00"));
    EXPECT_FALSE(d.load_state("sha256:v1 zz"));
    EXPECT_FALSE(d.load_state("sha256:v1 00000000"));
}

TEST(ByteStream, MemorySourceHonorsBaseOffset) {
    MemorySource src("world", 6);
    EXPECT_EQ(src.size(), 11u);
    std::string out;
    ASSERT_TRUE(src.read_exact(6, 5, out).is_ok());
    EXPECT_EQ(out, "world");
    char c;
    EXPECT_TRUE(src.read_at(0, &c, 1).is_err());
    auto eof = src.read_at(11, &c, 1);
    ASSERT_TRUE(eof.is_ok());
    EXPECT_EQ(eof.value, 0u);
}

TEST(ByteStream, FileSinkKeepsBytesAcrossReopen) {
    fs::path dir = platform::temp_file("coldxfer_stream_test");
    fs::path path = dir / "out.part";
    {
        auto sink = FileSink::open(path);
        ASSERT_TRUE(sink.is_ok()) << sink.error;
        ASSERT_TRUE(sink.value->write_at(0, "hello world", 11).is_ok());
        ASSERT_TRUE(sink.value->sync().is_ok());
    }
    {
        auto sink = FileSink::open(path);
        ASSERT_TRUE(sink.is_ok()) << sink.error;
        auto size = sink.value->size();
        ASSERT_TRUE(size.is_ok());
        EXPECT_EQ(size.value, 11u);
        ASSERT_TRUE(sink.value->truncate(5).is_ok());
    }
    auto content = platform::read_file(path);
    ASSERT_TRUE(content.is_ok());
    EXPECT_EQ(content.value, "hello");

    auto src = FileSource::open(path);
    ASSERT_TRUE(src.is_ok());
    std::string out;
    EXPECT_TRUE(src.value->read_exact(0, 6, out).is_err());

    fs::remove_all(dir);
}

TEST(ByteStream, FileSourceMissingFile) {
    auto src = FileSource::open("/nonexistent/coldxfer/file");
    EXPECT_TRUE(src.is_err());
}
