// tests/test_convert.cpp
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "app/convert_server.hpp"
#include "convert/transform.hpp"
#include "proto/control.hpp"
#include "util/fileio.hpp"

using namespace convert;

static std::vector<std::uint8_t> bytes_of(const std::string &s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

static std::string text_of(const std::vector<std::uint8_t> &v)
{
    return std::string(v.begin(), v.end());
}

static std::size_t count_of(const std::string &hay, const std::string &needle)
{
    std::size_t n = 0;
    for (auto pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1))
        ++n;
    return n;
}

TEST(TxtToPdf, SinglePage)
{
    TxtToPdf                  t;
    std::vector<std::uint8_t> out;
    std::string               err;
    ASSERT_TRUE(t.run("hello.txt", bytes_of("Hello (world)\nsecond line\n"), out, err));

    const std::string pdf = text_of(out);
    EXPECT_EQ(pdf.rfind("%PDF-1.4\n", 0), 0u);
    EXPECT_NE(pdf.find("/BaseFont /Helvetica"), std::string::npos);
    EXPECT_NE(pdf.find("(Hello \\(world\\)) Tj"), std::string::npos);
    EXPECT_NE(pdf.find("(second line) Tj"), std::string::npos);
    EXPECT_NE(pdf.find("/Count 1 "), std::string::npos);
    EXPECT_EQ(pdf.substr(pdf.size() - 6), "%%EOF\n");
}

TEST(TxtToPdf, WrapsAndPaginates)
{
    std::string text;
    for (std::size_t i = 0; i < TxtToPdf::LINES_PER_PAGE + 1; ++i)
        text += "line\n";
    text += std::string(TxtToPdf::WRAP_COLUMNS + 10, 'x');

    TxtToPdf                  t;
    std::vector<std::uint8_t> out;
    std::string               err;
    ASSERT_TRUE(t.run("long.txt", bytes_of(text), out, err));

    const std::string pdf = text_of(out);
    EXPECT_NE(pdf.find("/Count 2 "), std::string::npos);
    EXPECT_EQ(count_of(pdf, "/Type /Page "), 2u);
    EXPECT_NE(pdf.find("(" + std::string(TxtToPdf::WRAP_COLUMNS, 'x') + ") Tj"),
              std::string::npos);
    EXPECT_NE(pdf.find("(xxxxxxxxxx) Tj"), std::string::npos);
}

TEST(TxtToPdf, XrefOffsetsPointAtObjects)
{
    TxtToPdf                  t;
    std::vector<std::uint8_t> out;
    std::string               err;
    ASSERT_TRUE(t.run("x.txt", bytes_of("abc"), out, err));
    const std::string pdf = text_of(out);

    auto xref = pdf.find("xref\n");
    ASSERT_NE(xref, std::string::npos);
    auto sx = pdf.find("startxref\n");
    ASSERT_NE(sx, std::string::npos);
    EXPECT_EQ(std::stoul(pdf.substr(sx + 10)), xref);

    // first entry after the free one is object 1
    auto first = pdf.find("0000000000 65535 f \n") + 20;
    auto off   = std::stoul(pdf.substr(first, 10));
    EXPECT_EQ(pdf.compare(off, 8, "1 0 obj\n"), 0);
}

TEST(Registry, BuiltinsAndUnsupported)
{
    auto reg = TransformRegistry::with_builtins();
    EXPECT_TRUE(reg.supports("txt", "pdf"));
    EXPECT_FALSE(reg.supports("pdf", "txt"));
    EXPECT_FALSE(reg.supports("png", "pdf"));
    ASSERT_EQ(reg.pairs().size(), 1u);

    std::vector<std::uint8_t> out;
    std::string               err;
    EXPECT_TRUE(reg.run("txt:pdf", "a.txt", bytes_of("hi"), out, err));
    EXPECT_FALSE(out.empty());

    out.clear();
    EXPECT_FALSE(reg.run("png:pdf", "a.png", bytes_of("hi"), out, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(reg.run("txtpdf", "a.txt", bytes_of("hi"), out, err));
}

TEST(Registry, SplitMode)
{
    std::string src, dst;
    EXPECT_TRUE(split_mode("txt:pdf", src, dst));
    EXPECT_EQ(src, "txt");
    EXPECT_EQ(dst, "pdf");
    EXPECT_FALSE(split_mode(":pdf", src, dst));
    EXPECT_FALSE(split_mode("txt:", src, dst));
    EXPECT_FALSE(split_mode("txt", src, dst));
}

namespace
{
class Failing : public ITransform
{
  public:
    bool run(const std::string &, const std::vector<std::uint8_t> &, std::vector<std::uint8_t> &,
             std::string &err) override
    {
        err = "boom";
        return false;
    }
};
}  // namespace

TEST(Registry, CustomTransformFailure)
{
    TransformRegistry reg;
    reg.add("txt", "bin", std::make_unique<Failing>());
    EXPECT_TRUE(reg.supports("txt", "bin"));

    std::vector<std::uint8_t> out;
    std::string               err;
    EXPECT_FALSE(reg.run("txt:bin", "a.txt", bytes_of("x"), out, err));
    EXPECT_EQ(err, "boom");
}

TEST(OutputName, StemTagExtension)
{
    const std::string n = app::output_name("dir/report.final.txt", "pdf");
    ASSERT_EQ(n.size(), std::string("report.final_").size() + 8 + 4);
    EXPECT_EQ(n.rfind("report.final_", 0), 0u);
    EXPECT_EQ(n.substr(n.size() - 4), ".pdf");
    EXPECT_EQ(n.find_first_not_of("0123456789abcdef", 13), n.size() - 4);

    EXPECT_EQ(fileio::safe_basename("../../etc/passwd"), "passwd");
    EXPECT_EQ(fileio::safe_basename(".."), "");
    EXPECT_EQ(fileio::stem(".bashrc"), ".bashrc");
}

TEST(OutputName, LongStemIsCappedToMetadataLimit)
{
    const std::string n = app::output_name(std::string(300, 'n') + ".txt", "pdf");
    EXPECT_LE(n.size(), proto::FILENAME_MAX_LEN);
    EXPECT_EQ(n.substr(n.size() - 4), ".pdf");
    EXPECT_EQ(n.rfind(std::string(200, 'n'), 0), 0u);

    proto::Metadata m;
    m.filename    = n;
    m.byte_length = 1;
    m.total_count = 1;
    m.mode        = "txt:pdf";
    auto            buf = proto::encode_metadata(m);
    proto::Metadata back;
    ASSERT_TRUE(proto::parse_metadata(buf.data(), buf.size(), back));
    EXPECT_EQ(back.filename, n);
}

TEST(OutputName, CapKeepsUtf8Whole)
{
    std::string stem;
    for (int i = 0; i < 200; ++i)
        stem += "\xC3\xA9";
    const std::string n = app::output_name(stem + ".txt", "pdf");
    EXPECT_LE(n.size(), proto::FILENAME_MAX_LEN);

    const std::size_t cut = n.size() - std::string("_01234567.pdf").size();
    EXPECT_EQ(cut % 2, 0u);
    EXPECT_EQ(static_cast<unsigned char>(n[cut - 1]), 0xA9);
    EXPECT_EQ(n.compare(0, cut, stem, 0, cut), 0);
}
