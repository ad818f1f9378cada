// tests/test_packet.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "proto/control.hpp"
#include "proto/packet.hpp"

using namespace proto;
using udpconv::Error;

TEST(Packet, HeaderIsBigEndian)
{
    Packet p = make_packet(PacketType::Data, 0x01020304, 0x0A0B0C0D, {0xEE});
    auto   f = encode(p);
    ASSERT_EQ(f.size(), HDR_SIZE + 1);
    EXPECT_EQ(f[0], 0x03);
    EXPECT_EQ(f[1], 0x01);
    EXPECT_EQ(f[2], 0x02);
    EXPECT_EQ(f[3], 0x03);
    EXPECT_EQ(f[4], 0x04);
    EXPECT_EQ(f[5], 0x0A);
    EXPECT_EQ(f[8], 0x0D);
    EXPECT_EQ(f[9], 0xEE);
}

TEST(Packet, EncodeDecode_FullPayload)
{
    std::vector<std::uint8_t> payload(MAX_PAYLOAD);
    for (std::size_t i = 0; i < payload.size(); ++i)
        payload[i] = static_cast<std::uint8_t>(i * 7);

    Packet p = make_packet(PacketType::Data, 41, 42, payload);
    auto   f = encode(p);
    ASSERT_EQ(f.size(), MAX_PACKET);

    Error err = Error::Decode;
    auto  d   = decode(f, &err);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(err, Error::Ok);
    EXPECT_EQ(*d, p);
}

TEST(Packet, EncodeDecode_EmptyPayload)
{
    Packet p = make_packet(PacketType::Complete, 0, 0);
    auto   f = encode(p);
    ASSERT_EQ(f.size(), HDR_SIZE);
    auto d = decode(f);
    ASSERT_TRUE(d.has_value());
    EXPECT_TRUE(d->payload.empty());
    EXPECT_EQ(d->type, PacketType::Complete);
}

TEST(Packet, EncodeRejectsOversizedPayload)
{
    Packet p = make_packet(PacketType::Data, 0, 1, std::vector<std::uint8_t>(MAX_PAYLOAD + 1));
    EXPECT_TRUE(encode(p).empty());
}

TEST(Packet, EncodeRejectsDataSeqPastTotal)
{
    EXPECT_TRUE(encode(make_packet(PacketType::Data, 3, 3, {1})).empty());
    EXPECT_FALSE(encode(make_packet(PacketType::Data, 2, 3, {1})).empty());
}

TEST(Packet, DecodeShortFrame)
{
    std::vector<std::uint8_t> f = {0x03, 0, 0, 0, 0, 0, 0, 0};
    Error                     err{};
    EXPECT_FALSE(decode(f, &err).has_value());
    EXPECT_EQ(err, Error::Decode);
    EXPECT_FALSE(decode(nullptr, 0, &err).has_value());
}

TEST(Packet, DecodeUnknownType)
{
    Error err{};
    for (std::uint8_t t : {std::uint8_t{0x00}, std::uint8_t{0x0A}, std::uint8_t{0xFF}})
    {
        std::vector<std::uint8_t> f(HDR_SIZE, 0);
        f[0] = t;
        EXPECT_FALSE(decode(f, &err).has_value()) << "type " << int(t);
        EXPECT_EQ(err, Error::Decode);
    }
}

TEST(Packet, DecodeOversizedFrame)
{
    std::vector<std::uint8_t> f(MAX_PACKET + 1, 0);
    f[0] = 0x03;
    Error err{};
    EXPECT_FALSE(decode(f, &err).has_value());
    EXPECT_EQ(err, Error::Decode);
}

TEST(Packet, TypeNames)
{
    EXPECT_STREQ(type_name(PacketType::Command), "COMMAND");
    EXPECT_STREQ(type_name(PacketType::Complete), "COMPLETE");
    EXPECT_TRUE(is_known_type(0x01));
    EXPECT_TRUE(is_known_type(0x09));
    EXPECT_FALSE(is_known_type(0x00));
    EXPECT_FALSE(is_known_type(0x10));
}

TEST(Control, AckCarriesAcknowledgedType)
{
    Packet a = make_ack(PacketType::Metadata, 0);
    ASSERT_TRUE(acked_type(a).has_value());
    EXPECT_EQ(*acked_type(a), PacketType::Metadata);

    Packet n = make_nack(PacketType::Hash, 0, "hash_mismatch");
    EXPECT_EQ(*acked_type(n), PacketType::Hash);
    EXPECT_EQ(nack_reason(n), "hash_mismatch");

    // survives the wire
    auto d = decode(encode(n));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(nack_reason(*d), "hash_mismatch");

    Packet bare = make_packet(PacketType::Ack, 5, 0);
    EXPECT_FALSE(acked_type(bare).has_value());
    EXPECT_FALSE(acked_type(make_text(PacketType::Ok, "OK")).has_value());
}

TEST(Control, MetadataTlv)
{
    Metadata m;
    m.filename    = "report.txt";
    m.byte_length = 2049;
    m.total_count = chunks_for(2049);
    m.mode        = "txt:pdf";
    EXPECT_EQ(m.total_count, 3u);

    auto     buf = encode_metadata(m);
    Metadata back;
    ASSERT_TRUE(parse_metadata(buf.data(), buf.size(), back));
    EXPECT_EQ(back, m);
}

TEST(Control, MetadataLongFilename)
{
    Metadata m;
    m.filename    = std::string(FILENAME_MAX_LEN, 'n');
    m.byte_length = 5;
    m.total_count = 1;
    m.mode        = "txt:pdf";

    auto     buf = encode_metadata(m);
    Metadata back;
    ASSERT_TRUE(parse_metadata(buf.data(), buf.size(), back));
    EXPECT_EQ(back, m);

    // one byte over: refused outright instead of cut short
    m.filename = std::string(FILENAME_MAX_LEN - 12, 'n') + "_0123abcd.pdf" + "x";
    ASSERT_GT(m.filename.size(), FILENAME_MAX_LEN);
    EXPECT_FALSE(metadata_fits(m));
    EXPECT_TRUE(encode_metadata(m).empty());

    m.filename = "a.txt";
    m.mode     = std::string(MODE_MAX_LEN + 1, 'm');
    EXPECT_TRUE(encode_metadata(m).empty());
}

TEST(Control, MetadataSkipsUnknownTags)
{
    Metadata m;
    m.filename    = "a";
    m.byte_length = 1;
    m.total_count = 1;
    auto buf      = encode_metadata(m);
    std::vector<std::uint8_t> extra = {0x7F, 0x00, 0x02, 'h', 'i'};
    buf.insert(buf.begin(), extra.begin(), extra.end());

    Metadata back;
    ASSERT_TRUE(parse_metadata(buf.data(), buf.size(), back));
    EXPECT_EQ(back, m);
}

TEST(Control, MetadataRejectsMalformed)
{
    Metadata m;
    m.filename    = "x.txt";
    m.byte_length = 10;
    m.total_count = 1;
    auto     buf  = encode_metadata(m);
    Metadata out;

    // truncated last record
    EXPECT_FALSE(parse_metadata(buf.data(), buf.size() - 1, out));

    // length field with the wrong width
    std::vector<std::uint8_t> bad = {T_LENGTH, 0x00, 0x04, 0, 0, 0, 1,
                                     T_TOTAL,  0x00, 0x04, 0, 0, 0, 1};
    EXPECT_FALSE(parse_metadata(bad.data(), bad.size(), out));

    // missing total
    std::vector<std::uint8_t> no_total = {T_LENGTH, 0x00, 0x08, 0, 0, 0, 0, 0, 0, 0, 1};
    EXPECT_FALSE(parse_metadata(no_total.data(), no_total.size(), out));
}

TEST(Control, ChunkCount)
{
    EXPECT_EQ(chunks_for(0), 0u);
    EXPECT_EQ(chunks_for(1), 1u);
    EXPECT_EQ(chunks_for(1024), 1u);
    EXPECT_EQ(chunks_for(1025), 2u);
    EXPECT_EQ(chunks_for(10u * 1024 * 1024), 10240u);
}

TEST(Control, Redirect)
{
    Packet p = make_redirect(0xCAFEBABE, 40001);
    EXPECT_EQ(p.seq, 0xCAFEBABEu);
    ASSERT_EQ(p.payload.size(), 2u);
    EXPECT_EQ(p.payload[0], 40001 >> 8);
    auto port = parse_redirect(p);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 40001);

    EXPECT_FALSE(parse_redirect(make_redirect(1, 0)).has_value());
    EXPECT_FALSE(parse_redirect(make_text(PacketType::Ok, "OK")).has_value());
}

TEST(Control, ParseCommand)
{
    Command     c;
    std::string reason;
    ASSERT_TRUE(parse_command("CONVERT .TXT pdf notes.txt", c, reason));
    EXPECT_EQ(c.src, "txt");
    EXPECT_EQ(c.dst, "pdf");
    EXPECT_EQ(c.filename, "notes.txt");
    EXPECT_EQ(c.mode(), "txt:pdf");
    EXPECT_EQ(format_command(c), "CONVERT txt pdf notes.txt");

    EXPECT_FALSE(parse_command("RESIZE a b c", c, reason));
    EXPECT_EQ(reason, R_INVALID_COMMAND);
    EXPECT_FALSE(parse_command("", c, reason));
    EXPECT_EQ(reason, R_INVALID_COMMAND);
    EXPECT_FALSE(parse_command("CONVERT txt pdf", c, reason));
    EXPECT_EQ(reason, R_BAD_FORMAT);
    EXPECT_FALSE(parse_command("CONVERT . pdf a.txt", c, reason));
    EXPECT_EQ(reason, R_BAD_FORMAT);
}
