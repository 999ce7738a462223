#include "uplink/hasher.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

using namespace uplink;

namespace {

const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const std::string EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

} // namespace

TEST(HasherTest, StreamMatchesKnownDigest) {
    Sha256Stream stream;
    stream.update("a", 1);
    stream.update("bc", 2);
    EXPECT_EQ(stream.hex(), ABC_SHA256);
}

TEST(HasherTest, EmptyInput) {
    Sha256Stream stream;
    EXPECT_EQ(stream.hex(), EMPTY_SHA256);
}

TEST(HasherTest, FinishedStreamRejectsUse) {
    Sha256Stream stream;
    stream.hex();
    EXPECT_THROW(stream.update("x", 1), std::logic_error);
    EXPECT_THROW(stream.hex(), std::logic_error);
}

TEST(HasherTest, FileDigestIndependentOfBufferSize) {
    fakes::TempDir dir;
    auto path = dir.path() / "abc.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    Sha256Hasher one_byte(1);
    Sha256Hasher large;
    EXPECT_EQ(one_byte.hashFile(path), ABC_SHA256);
    EXPECT_EQ(large.hashFile(path), ABC_SHA256);
}

TEST(HasherTest, MissingFileThrows) {
    Sha256Hasher hasher;
    EXPECT_THROW(hasher.hashFile("/nonexistent/uplink/file.bin"), std::runtime_error);
}

TEST(HasherTest, RandomHexHasRequestedLength) {
    auto a = random_hex(16);
    auto b = random_hex(16);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}
