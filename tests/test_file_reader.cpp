#include "io/file_reader.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class FileReaderTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }

    void WriteFile(const std::string& path, const std::vector<std::uint8_t>& data) {
        std::ofstream os(path, std::ios::binary);
        ASSERT_TRUE(os.good());
        os.write(reinterpret_cast<const char*>(data.data()),
                 static_cast<std::streamsize>(data.size()));
        os.close();
        ASSERT_TRUE(os.good());
    }
};

TEST_F(FileReaderTests, OpenOK_AndTotalSizeMatches) {
    const std::string p = MakePath("in.bin");
    std::vector<std::uint8_t> data(12345);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>(i & 0xFF);
    WriteFile(p, data);

    seed::FileOrStdinReader r;
    auto res = seed::FileOrStdinReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    auto sz = r.TotalSize();
    ASSERT_TRUE(sz.has_value());
    EXPECT_EQ(*sz, data.size());
}

TEST_F(FileReaderTests, OpenNonexistent_Fails) {
    seed::FileOrStdinReader r;
    auto res = seed::FileOrStdinReader::Open(MakePath("nope.bin"), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, ENOENT);
    EXPECT_NE(res.msg.find("nope.bin"), std::string::npos);
}

TEST_F(FileReaderTests, ReadFileOrStdin_ReturnsAllBytes) {
    const std::string p = MakePath("archive.zip");
    std::vector<std::uint8_t> data(2 * 1024 * 1024 + 7);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>((i * 13) & 0xFF);
    WriteFile(p, data);

    std::vector<std::uint8_t> out;
    auto res = seed::ReadFileOrStdin(p, out);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(out, data);
}

TEST_F(FileReaderTests, ReadFileOrStdin_AsText) {
    const std::string p = MakePath("metadata.json");
    const std::string text = "{\"a\": 1}\n";
    WriteFile(p, std::vector<std::uint8_t>(text.begin(), text.end()));

    std::string out;
    ASSERT_TRUE(seed::ReadFileOrStdin(p, out).ok);
    EXPECT_EQ(out, text);
}

TEST(ReadAllTests, DrainsReaderInChunks) {
    std::string payload(200 * 1024, 'z');
    testutil::MemoryReader reader(payload);

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(seed::ReadAll(reader, out).ok);
    EXPECT_EQ(out.size(), payload.size());
    EXPECT_EQ(std::string(out.begin(), out.end()), payload);
}

} // namespace
