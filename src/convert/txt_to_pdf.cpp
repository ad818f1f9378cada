#include <cstdio>
#include <string>
#include <vector>

#include "convert/transform.hpp"

namespace convert
{

namespace
{

// Latin text only: UTF-8 sequences collapse to '?', tabs expand to four spaces.
std::vector<std::string> layout_lines(const std::vector<std::uint8_t> &in, std::size_t columns)
{
    std::vector<std::string> lines;
    std::string              cur;
    auto flush = [&]() {
        lines.push_back(cur);
        cur.clear();
    };

    for (std::uint8_t b : in)
    {
        if (b == '\n')
        {
            flush();
            continue;
        }
        if (b == '\r' || (b >= 0x80 && b < 0xC0))
            continue;
        if (b == '\t')
        {
            cur.append(4, ' ');
        }
        else if (b >= 0xC0)
        {
            cur.push_back('?');
        }
        else if (b < 0x20 || b == 0x7F)
        {
            continue;
        }
        else
        {
            cur.push_back(static_cast<char>(b));
        }
        while (cur.size() > columns)
        {
            lines.push_back(cur.substr(0, columns));
            cur.erase(0, columns);
        }
    }
    if (!cur.empty() || lines.empty())
        flush();
    return lines;
}

std::string pdf_escape(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        if (c == '(' || c == ')' || c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

class PdfWriter
{
  public:
    // objects are numbered from 1 in the order they are written
    void object(const std::string &body)
    {
        offsets_.push_back(buf_.size());
        buf_ += std::to_string(offsets_.size()) + " 0 obj\n" + body + "\nendobj\n";
    }

    std::vector<std::uint8_t> finish(std::size_t root)
    {
        const std::size_t xref = buf_.size();
        buf_ += "xref\n0 " + std::to_string(offsets_.size() + 1) + "\n";
        buf_ += "0000000000 65535 f \n";
        char line[32];
        for (std::size_t off : offsets_)
        {
            std::snprintf(line, sizeof(line), "%010zu 00000 n \n", off);
            buf_ += line;
        }
        buf_ += "trailer\n<< /Size " + std::to_string(offsets_.size() + 1) + " /Root " +
                std::to_string(root) + " 0 R >>\nstartxref\n" + std::to_string(xref) +
                "\n%%EOF\n";
        return std::vector<std::uint8_t>(buf_.begin(), buf_.end());
    }

  private:
    std::string              buf_ = "%PDF-1.4\n";
    std::vector<std::size_t> offsets_;
};

}  // namespace

bool TxtToPdf::run(const std::string & /*filename*/, const std::vector<std::uint8_t> &in,
                   std::vector<std::uint8_t> &out, std::string &err)
{
    const auto        lines = layout_lines(in, WRAP_COLUMNS);
    const std::size_t pages = (lines.size() + LINES_PER_PAGE - 1) / LINES_PER_PAGE;
    if (pages == 0)
    {
        err = "nothing to render";
        return false;
    }

    // 1 catalog, 2 page tree, 3 font, then (page, content) pairs
    PdfWriter   w;
    std::string kids;
    for (std::size_t i = 0; i < pages; ++i)
        kids += std::to_string(4 + 2 * i) + " 0 R ";

    w.object("<< /Type /Catalog /Pages 2 0 R >>");
    w.object("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages) + " >>");
    w.object("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

    for (std::size_t i = 0; i < pages; ++i)
    {
        std::string text = "BT\n/F1 11 Tf\n13 TL\n72 720 Td\n";
        for (std::size_t l = i * LINES_PER_PAGE; l < lines.size() && l < (i + 1) * LINES_PER_PAGE;
             ++l)
            text += "(" + pdf_escape(lines[l]) + ") Tj T*\n";
        text += "ET";

        w.object("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Resources << /Font << "
                 "/F1 3 0 R >> >> /Contents " +
                 std::to_string(5 + 2 * i) + " 0 R >>");
        w.object("<< /Length " + std::to_string(text.size()) + " >>\nstream\n" + text +
                 "\nendstream");
    }

    out = w.finish(1);
    return true;
}

}  // namespace convert
